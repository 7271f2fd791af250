/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_FRAME_ENCODER_HPP_INCLUDED__
#define __RSFRAME_FRAME_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include <boost/asio/buffer.hpp>

#include "../include/rsframe.h"
#include "protocol/frame_header.hpp"
#include "protocol/frame_type.hpp"
#include "utils/macros.hpp"

namespace rsframe
{
typedef rsframe_fields_t frame_fields_t;

void init_fields (frame_fields_t *fields_, int type_, uint32_t stream_id_);

//  Table-driven frame encoder. load() validates a field set against the
//  taxonomy and computes the layout; the encode functions then write
//  header, fixed fields, initial request-N, metadata block and data in
//  wire order.
//
//  The encoder keeps pointers to the metadata and data of the loaded
//  field set. gather() hands them out without copying, together with the
//  encoder's own header bytes; all of them stay valid until the next
//  load() or the encoder's destruction.
class frame_encoder_t
{
  public:
    frame_encoder_t ();

    //  Returns 0, or -1 with errno set to EINVAL, EUNKNOWNTYPE, ENOTSUP,
    //  EDATANOTSUP or EMSGSIZE.
    int load (const frame_fields_t &fields_);

    //  Encoded size of the loaded frame, length prefix excluded.
    size_t size () const { return _size; }

    //  Writes the frame into buffer_. Returns the number of bytes written
    //  or -1 with errno set to ENOBUFS, or EMSGSIZE if the frame is too
    //  large for a length prefix.
    int encode (unsigned char *buffer_, size_t size_, bool length_prefix_);

    //  Appends the frame to out_.
    int encode (std::vector<unsigned char> &out_, bool length_prefix_);

    //  Appends the frame to out_ as a buffer sequence for scatter-gather
    //  writes.
    int gather (std::vector<boost::asio::const_buffer> &out_,
                bool length_prefix_);

  private:
    //  Writes the bytes in front of the metadata content into _tmp_buf.
    void prepare_head ();

    int check_prefix (bool length_prefix_) const;

    enum
    {
        max_head_size = RSFRAME_LENGTH_PREFIX_SIZE + header_size + 8
                        + request_n_size + metadata_length_size
    };

    frame_fields_t _fields;
    const frame_type_info_t *_info;
    int _flags;
    size_t _size;

    //  Length prefix, header and fixed fields. The prefix occupies the
    //  first three bytes whether or not it is written out.
    unsigned char _tmp_buf[max_head_size];
    size_t _head_size;

    RSFRAME_NON_COPYABLE_NOR_MOVABLE (frame_encoder_t)
};

//  Encodes one frame described by fields_ and appends it to out_.
int encode_frame (std::vector<unsigned char> &out_,
                  const frame_fields_t &fields_,
                  bool length_prefix_ = false);

//  Per-kind encoders. A NULL metadata_ means the frame carries no metadata
//  block; a zero-sized one is a present, empty block.
int encode_request_response (std::vector<unsigned char> &out_,
                             uint32_t stream_id_,
                             const boost::asio::const_buffer *metadata_,
                             const boost::asio::const_buffer &data_,
                             int flags_ = 0);
int encode_request_fnf (std::vector<unsigned char> &out_,
                        uint32_t stream_id_,
                        const boost::asio::const_buffer *metadata_,
                        const boost::asio::const_buffer &data_,
                        int flags_ = 0);
int encode_request_stream (std::vector<unsigned char> &out_,
                           uint32_t stream_id_,
                           uint32_t initial_request_n_,
                           const boost::asio::const_buffer *metadata_,
                           const boost::asio::const_buffer &data_,
                           int flags_ = 0);
int encode_request_channel (std::vector<unsigned char> &out_,
                            uint32_t stream_id_,
                            uint32_t initial_request_n_,
                            const boost::asio::const_buffer *metadata_,
                            const boost::asio::const_buffer &data_,
                            int flags_ = 0);
int encode_request_n (std::vector<unsigned char> &out_,
                      uint32_t stream_id_,
                      uint32_t request_n_);
int encode_cancel (std::vector<unsigned char> &out_, uint32_t stream_id_);
int encode_payload (std::vector<unsigned char> &out_,
                    uint32_t stream_id_,
                    int flags_,
                    const boost::asio::const_buffer *metadata_,
                    const boost::asio::const_buffer &data_);
int encode_error (std::vector<unsigned char> &out_,
                  uint32_t stream_id_,
                  uint32_t error_code_,
                  const boost::asio::const_buffer &data_);
int encode_metadata_push (std::vector<unsigned char> &out_,
                          const boost::asio::const_buffer &metadata_);
int encode_keepalive (std::vector<unsigned char> &out_,
                      uint64_t last_position_,
                      bool respond_,
                      const boost::asio::const_buffer &data_);
int encode_lease (std::vector<unsigned char> &out_,
                  uint32_t ttl_,
                  uint32_t requests_,
                  const boost::asio::const_buffer *metadata_);
}

#endif
