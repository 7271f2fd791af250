/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_STREAM_DECODER_HPP_INCLUDED__
#define __RSFRAME_STREAM_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "core/options.hpp"
#include "protocol/frame.hpp"
#include "utils/macros.hpp"

namespace rsframe
{
//  Decoder for byte-stream transports (3-byte length prefix per frame).
//
//  When a whole frame lies within the buffer passed to decode(), the
//  decoded frame views that buffer directly; otherwise the frame is
//  collected into a buffer owned by the decoder. In both cases the frame
//  is valid until the next call to decode() or reset(), and the caller's
//  buffer must be kept unchanged until then.
class stream_decoder_t
{
  public:
    stream_decoder_t ();
    explicit stream_decoder_t (const options_t &options_);
    ~stream_decoder_t ();

    bool check_tag () const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Consumes bytes from data_ and stores the count in *consumed_.
    //  Returns 1 when frame() holds a decoded frame, 0 when all input was
    //  consumed without completing a frame, or -1 with errno set. After a
    //  failure the decoder refuses input with EFSM until reset().
    int decode (const unsigned char *data_, size_t size_, size_t *consumed_);

    const frame_t &frame () const { return _frame; }

    void reset ();

  private:
    typedef int (stream_decoder_t::*step_t) (const unsigned char *,
                                              size_t,
                                              size_t *);

    //  Next step functions. They receive the unconsumed rest of the input.
    int length_ready (const unsigned char *read_from_,
                      size_t available_,
                      size_t *consumed_);
    int body_ready (const unsigned char *read_from_,
                    size_t available_,
                    size_t *consumed_);

    void next_step (unsigned char *read_pos_, size_t to_read_, step_t next_)
    {
        _read_pos = read_pos_;
        _to_read = to_read_;
        _next = next_;
    }

    options_t _options;

    unsigned char _tmpbuf[RSFRAME_LENGTH_PREFIX_SIZE];
    std::vector<unsigned char> _body;

    unsigned char *_read_pos;
    size_t _to_read;
    step_t _next;
    bool _failed;

    frame_t _frame;

    uint32_t _tag;

    RSFRAME_NON_COPYABLE_NOR_MOVABLE (stream_decoder_t)
};
}

#endif
