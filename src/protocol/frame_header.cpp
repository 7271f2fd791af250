/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_header.hpp"
#include "protocol/stream_id.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

int rsframe::encode_header (unsigned char *buffer_,
                            size_t size_,
                            uint32_t stream_id_,
                            int type_,
                            int flags_)
{
    if (!stream_id_valid (stream_id_) || (flags_ & ~header_flags_mask)) {
        errno = EINVAL;
        return -1;
    }
    if (!find_frame_type (type_))
        return -1;
    if (size_ < header_size) {
        errno = ENOBUFS;
        return -1;
    }

    put_uint32 (buffer_, stream_id_);
    put_uint16 (buffer_ + 4,
                static_cast<uint16_t> ((type_ << header_type_shift) | flags_));
    return header_size;
}

int rsframe::decode_header (const unsigned char *buffer_,
                            size_t size_,
                            frame_header_t *header_)
{
    if (unlikely (size_ < header_size)) {
        RSFRAME_DBG_DECODE ("header truncated: %zu bytes", size_);
        errno = EMALFORMED;
        return -1;
    }

    const uint32_t stream_id = get_uint32 (buffer_);
    if (unlikely (!stream_id_valid (stream_id))) {
        RSFRAME_DBG_DECODE ("reserved stream id bit set: 0x%08x", stream_id);
        errno = EMALFORMED;
        return -1;
    }

    const uint16_t type_and_flags = get_uint16 (buffer_ + 4);
    const frame_type_info_t *info =
      find_frame_type (type_and_flags >> header_type_shift);
    if (unlikely (!info)) {
        RSFRAME_DBG_DECODE ("unknown frame type 0x%02x",
                            type_and_flags >> header_type_shift);
        errno = EMALFORMED;
        return -1;
    }

    header_->stream_id = stream_id;
    header_->info = info;
    header_->flags = type_and_flags & header_flags_mask;
    return 0;
}
