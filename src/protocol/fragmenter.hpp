/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_FRAGMENTER_HPP_INCLUDED__
#define __RSFRAME_FRAGMENTER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "protocol/frame_encoder.hpp"
#include "utils/macros.hpp"

namespace rsframe
{
//  Splits one logical frame into a chain of frames no larger than a given
//  size (length prefix excluded).
//
//  The first frame keeps the type and the fixed fields of the input;
//  continuations are PAYLOAD frames with NEXT set. Metadata is sent
//  before data, and each frame that carries a slice of metadata has its
//  own metadata length. All frames but the last have FOLLOWS set, and
//  only the last one inherits COMPLETE from the input flags.
//
//  The metadata and data referenced by the field set are not copied and
//  must outlive the fragmenter.
class fragmenter_t
{
  public:
    fragmenter_t ();
    ~fragmenter_t ();

    bool check_tag () const;

    //  Returns 0, or -1 with errno set to EINVAL (size too small to make
    //  progress), EMSGSIZE (type cannot be fragmented) or any error of
    //  frame_encoder_t::load().
    int init (const frame_fields_t &fields_, size_t max_frame_size_);

    //  Writes the next frame into buffer_. Returns the number of bytes
    //  written, 0 once the chain is complete, or -1 with errno set.
    int next (unsigned char *buffer_, size_t size_, bool length_prefix_);

    //  Appends the next frame to out_.
    int next (std::vector<unsigned char> &out_, bool length_prefix_);

    bool done () const { return _done; }

    //  Number of frames produced so far.
    int count () const { return _count; }

  private:
    //  Loads the field set of the next frame into _encoder.
    int prepare ();

    frame_fields_t _fields;
    const frame_type_info_t *_info;
    size_t _max_frame_size;
    bool _whole;
    bool _done;
    int _count;
    size_t _metadata_pos;
    size_t _data_pos;

    frame_encoder_t _encoder;

    uint32_t _tag;

    RSFRAME_NON_COPYABLE_NOR_MOVABLE (fragmenter_t)
};
}

#endif
