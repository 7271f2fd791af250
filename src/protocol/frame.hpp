/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_FRAME_HPP_INCLUDED__
#define __RSFRAME_FRAME_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <boost/asio/buffer.hpp>

#include "protocol/frame_header.hpp"
#include "protocol/frame_type.hpp"

namespace rsframe
{
//  A decoded frame. The frame does not own any bytes: metadata and data
//  are returned as views into the buffer passed to init(). The views, and
//  the frame itself, are invalidated once that buffer is released or
//  modified.
//
//  Decoding walks the fields in wire order: header, type-specific fixed
//  fields, initial request-N, metadata block (iff the METADATA flag is
//  set), data (whatever remains, iff the type can carry data). Any length
//  that does not add up exactly to the buffer size fails the decode.
class frame_t
{
  public:
    frame_t ();

    //  Returns 0, or -1 with errno set to EMALFORMED or EPAYLOADSIZE. On
    //  failure the frame is left empty. With strict_stream_ids_ the stream
    //  id must also match the scope of the frame type.
    int init (const unsigned char *buffer_,
              size_t size_,
              bool strict_stream_ids_ = false);

    //  Empties the frame, dropping the reference to the source buffer.
    void reset ();

    bool valid () const { return _buf != NULL; }

    uint32_t stream_id () const { return _header.stream_id; }
    //  -1 on an empty frame.
    int type () const { return _header.info ? _header.type () : -1; }
    //  Must only be called on a valid frame.
    const frame_type_info_t &info () const { return *_header.info; }
    int flags () const { return _header.flags; }
    bool has_metadata () const { return _header.has_metadata (); }
    bool has_follows () const { return _header.has_follows (); }
    bool is_complete () const
    {
        return (_header.flags & RSFRAME_FLAG_COMPLETE) != 0;
    }
    bool is_next () const { return (_header.flags & RSFRAME_FLAG_NEXT) != 0; }

    //  The whole encoded frame.
    boost::asio::const_buffer buffer () const
    {
        return boost::asio::const_buffer (_buf, _size);
    }

    //  The accessors below fail with EFSM on an empty frame.

    //  Fails with ENOMETADATA if the METADATA flag is not set, and with
    //  ENOTSUP on frame types whose body the codec does not interpret.
    int metadata (boost::asio::const_buffer *out_) const;

    //  Fails with EDATANOTSUP if the frame type cannot carry data. An empty
    //  data block is returned as a zero-sized buffer.
    int data (boost::asio::const_buffer *out_) const;

    //  Initial request-N of REQUEST_STREAM/REQUEST_CHANNEL, or the count
    //  of a REQUEST_N frame. Fails with EREQNNOTSUP otherwise.
    int request_n (uint32_t *out_) const;

    //  Fixed fields of ERROR, KEEPALIVE and LEASE. Fail with ENOTSUP on
    //  other frame types.
    int error_code (uint32_t *out_) const;
    int last_position (uint64_t *out_) const;
    int lease (uint32_t *ttl_, uint32_t *requests_) const;

    //  Length of the data block of the encoded frame in buffer_, derived
    //  as total - header - fixed fields - request-N - metadata block.
    //  Fails with EMALFORMED, EPAYLOADSIZE, or EDATANOTSUP for opaque
    //  frame types.
    static int data_length (const unsigned char *buffer_,
                            size_t size_,
                            size_t *length_);

  private:
    //  Locates the optional fields of a frame whose header is already
    //  decoded.
    static int layout (const unsigned char *buffer_,
                       size_t size_,
                       const frame_header_t &header_,
                       size_t *metadata_offset_,
                       size_t *metadata_size_,
                       size_t *data_offset_);

    const unsigned char *_buf;
    size_t _size;
    frame_header_t _header;
    size_t _metadata_offset;
    size_t _metadata_size;
    size_t _data_offset;
};
}

#endif
