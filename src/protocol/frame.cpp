/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame.hpp"
#include "protocol/stream_id.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/debug_counters.h"
#include "utils/err.hpp"

rsframe::frame_t::frame_t () :
    _buf (NULL),
    _size (0),
    _metadata_offset (0),
    _metadata_size (0),
    _data_offset (0)
{
    _header.stream_id = 0;
    _header.info = NULL;
    _header.flags = 0;
}

void rsframe::frame_t::reset ()
{
    _buf = NULL;
    _size = 0;
    _header.stream_id = 0;
    _header.info = NULL;
    _header.flags = 0;
    _metadata_offset = 0;
    _metadata_size = 0;
    _data_offset = 0;
}

int rsframe::frame_t::layout (const unsigned char *buffer_,
                              size_t size_,
                              const frame_header_t &header_,
                              size_t *metadata_offset_,
                              size_t *metadata_size_,
                              size_t *data_offset_)
{
    const frame_type_info_t &info = *header_.info;
    size_t offset = header_size;

    if (info.is_opaque ()) {
        *metadata_offset_ = 0;
        *metadata_size_ = 0;
        *data_offset_ = size_;
        return 0;
    }

    const size_t prefix = info.prefix_size ();
    if (unlikely (size_ - offset < prefix)) {
        RSFRAME_DBG_DECODE ("%s: fixed fields truncated", info.name);
        errno = EPAYLOADSIZE;
        return -1;
    }
    offset += prefix;

    size_t metadata_offset = 0;
    size_t metadata_size = 0;
    if (header_.has_metadata ()) {
        if (unlikely (!info.can_have_metadata ())) {
            RSFRAME_DBG_DECODE ("%s: METADATA flag on type without metadata",
                                info.name);
            errno = EMALFORMED;
            return -1;
        }
        if (unlikely (size_ - offset < metadata_length_size)) {
            RSFRAME_DBG_DECODE ("%s: metadata length truncated", info.name);
            errno = EPAYLOADSIZE;
            return -1;
        }
        metadata_size = get_uint24 (buffer_ + offset);
        offset += metadata_length_size;
        if (unlikely (size_ - offset < metadata_size)) {
            RSFRAME_DBG_DECODE ("%s: metadata length %zu exceeds %zu bytes",
                                info.name, metadata_size, size_ - offset);
            errno = EPAYLOADSIZE;
            return -1;
        }
        metadata_offset = offset;
        offset += metadata_size;
    }

    if (unlikely (!info.can_have_data () && offset != size_)) {
        RSFRAME_DBG_DECODE ("%s: %zu trailing bytes", info.name,
                            size_ - offset);
        errno = EPAYLOADSIZE;
        return -1;
    }

    *metadata_offset_ = metadata_offset;
    *metadata_size_ = metadata_size;
    *data_offset_ = offset;
    return 0;
}

int rsframe::frame_t::init (const unsigned char *buffer_,
                            size_t size_,
                            bool strict_stream_ids_)
{
    reset ();

    frame_header_t header;
    size_t metadata_offset = 0;
    size_t metadata_size = 0;
    size_t data_offset = 0;

    if (decode_header (buffer_, size_, &header) == -1
        || layout (buffer_, size_, header, &metadata_offset, &metadata_size,
                   &data_offset)
             == -1) {
        rsframe_debug_inc_decode_error_count ();
        return -1;
    }

    if (strict_stream_ids_ && !stream_scope_matches (*header.info,
                                                     header.stream_id)) {
        RSFRAME_DBG_DECODE ("%s not allowed on stream %u", header.info->name,
                            header.stream_id);
        rsframe_debug_inc_decode_error_count ();
        errno = EMALFORMED;
        return -1;
    }

    _buf = buffer_;
    _size = size_;
    _header = header;
    _metadata_offset = metadata_offset;
    _metadata_size = metadata_size;
    _data_offset = data_offset;
    rsframe_debug_inc_decoded_count ();
    return 0;
}

int rsframe::frame_t::metadata (boost::asio::const_buffer *out_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    if (!has_metadata ()) {
        errno = ENOMETADATA;
        return -1;
    }
    if (info ().is_opaque ()) {
        errno = ENOTSUP;
        return -1;
    }
    *out_ = boost::asio::const_buffer (_buf + _metadata_offset, _metadata_size);
    return 0;
}

int rsframe::frame_t::data (boost::asio::const_buffer *out_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    if (!info ().can_have_data ()) {
        errno = EDATANOTSUP;
        return -1;
    }
    *out_ =
      boost::asio::const_buffer (_buf + _data_offset, _size - _data_offset);
    return 0;
}

int rsframe::frame_t::request_n (uint32_t *out_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    const frame_type_info_t &type_info = info ();
    if (type_info.has_initial_request_n ()) {
        *out_ = get_uint32 (_buf + header_size + type_info.fixed_size);
        return 0;
    }
    if (type_info.fixed == fixed_request_n) {
        *out_ = get_uint32 (_buf + header_size);
        return 0;
    }
    errno = EREQNNOTSUP;
    return -1;
}

int rsframe::frame_t::error_code (uint32_t *out_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    if (info ().fixed != fixed_error_code) {
        errno = ENOTSUP;
        return -1;
    }
    *out_ = get_uint32 (_buf + header_size);
    return 0;
}

int rsframe::frame_t::last_position (uint64_t *out_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    if (info ().fixed != fixed_position) {
        errno = ENOTSUP;
        return -1;
    }
    *out_ = get_uint64 (_buf + header_size);
    return 0;
}

int rsframe::frame_t::lease (uint32_t *ttl_, uint32_t *requests_) const
{
    if (unlikely (!valid ())) {
        errno = EFSM;
        return -1;
    }
    if (info ().fixed != fixed_lease) {
        errno = ENOTSUP;
        return -1;
    }
    *ttl_ = get_uint32 (_buf + header_size);
    *requests_ = get_uint32 (_buf + header_size + 4);
    return 0;
}

int rsframe::frame_t::data_length (const unsigned char *buffer_,
                                   size_t size_,
                                   size_t *length_)
{
    frame_header_t header;
    if (decode_header (buffer_, size_, &header) == -1)
        return -1;
    if (header.info->is_opaque ()) {
        errno = EDATANOTSUP;
        return -1;
    }

    size_t metadata_offset = 0;
    size_t metadata_size = 0;
    size_t data_offset = 0;
    if (layout (buffer_, size_, header, &metadata_offset, &metadata_size,
                &data_offset)
        == -1)
        return -1;

    const size_t fixed = header_size + header.info->prefix_size ()
                         + (header.has_metadata ()
                              ? metadata_length_size + metadata_size
                              : 0);
    rsframe_assert (fixed == data_offset);
    *length_ = size_ - fixed;
    return 0;
}
