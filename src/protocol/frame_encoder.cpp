/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/stream_id.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <limits.h>
#include <string.h>

void rsframe::init_fields (frame_fields_t *fields_,
                           int type_,
                           uint32_t stream_id_)
{
    memset (fields_, 0, sizeof (frame_fields_t));
    fields_->type = type_;
    fields_->stream_id = stream_id_;
}

rsframe::frame_encoder_t::frame_encoder_t () :
    _info (NULL),
    _flags (0),
    _size (0),
    _head_size (0)
{
    init_fields (&_fields, 0, 0);
}

int rsframe::frame_encoder_t::load (const frame_fields_t &fields_)
{
    _info = NULL;

    const frame_type_info_t *info = find_frame_type (fields_.type);
    if (!info)
        return -1;
    if (info->is_opaque ()) {
        RSFRAME_DBG_ENCODE ("%s frames are not encoded here", info->name);
        errno = ENOTSUP;
        return -1;
    }
    if (!stream_id_valid (fields_.stream_id)
        || (fields_.flags & ~header_flags_mask)) {
        errno = EINVAL;
        return -1;
    }
    if ((fields_.metadata == NULL && fields_.metadata_size > 0)
        || (fields_.data == NULL && fields_.data_size > 0)) {
        errno = EINVAL;
        return -1;
    }
    if (fields_.has_metadata && !info->can_have_metadata ()) {
        errno = ENOTSUP;
        return -1;
    }
    if (fields_.has_metadata
        && fields_.metadata_size > RSFRAME_MAX_METADATA_SIZE) {
        errno = EMSGSIZE;
        return -1;
    }
    if (fields_.data_size > 0 && !info->can_have_data ()) {
        errno = EDATANOTSUP;
        return -1;
    }
    //  Encoded sizes are reported as int, length prefix included.
    if (fields_.data_size > static_cast<size_t> (INT_MAX)) {
        errno = EMSGSIZE;
        return -1;
    }

    _fields = fields_;
    _info = info;
    _flags = fields_.flags & ~RSFRAME_FLAG_METADATA;
    if (fields_.has_metadata)
        _flags |= RSFRAME_FLAG_METADATA;

    _size = header_size + info->prefix_size ();
    if (fields_.has_metadata)
        _size += metadata_length_size + fields_.metadata_size;
    if (info->can_have_data ())
        _size += fields_.data_size;
    if (_size > static_cast<size_t> (INT_MAX) - RSFRAME_LENGTH_PREFIX_SIZE) {
        RSFRAME_DBG_ENCODE ("%s: %zu bytes do not fit the encoded size",
                            info->name, _size);
        _info = NULL;
        errno = EMSGSIZE;
        return -1;
    }

    prepare_head ();
    return 0;
}

void rsframe::frame_encoder_t::prepare_head ()
{
    unsigned char *pos = _tmp_buf;

    put_uint24 (pos, static_cast<uint32_t> (_size & 0xFFFFFF));
    pos += RSFRAME_LENGTH_PREFIX_SIZE;

    const int rc = encode_header (pos, header_size, _fields.stream_id,
                                  _info->type, _flags);
    errno_assert (rc == header_size);
    pos += header_size;

    switch (_info->fixed) {
        case fixed_request_n:
            put_uint32 (pos, _fields.request_n);
            pos += 4;
            break;
        case fixed_error_code:
            put_uint32 (pos, _fields.error_code);
            pos += 4;
            break;
        case fixed_position:
            put_uint64 (pos, _fields.position);
            pos += 8;
            break;
        case fixed_lease:
            put_uint32 (pos, _fields.ttl);
            put_uint32 (pos + 4, _fields.lease_requests);
            pos += 8;
            break;
        default:
            break;
    }

    if (_info->has_initial_request_n ()) {
        put_uint32 (pos, _fields.request_n);
        pos += request_n_size;
    }

    if (_fields.has_metadata) {
        put_uint24 (pos, static_cast<uint32_t> (_fields.metadata_size));
        pos += metadata_length_size;
    }

    _head_size = static_cast<size_t> (pos - _tmp_buf);
    rsframe_assert (_head_size <= sizeof _tmp_buf);
}

int rsframe::frame_encoder_t::check_prefix (bool length_prefix_) const
{
    rsframe_assert (_info);
    if (length_prefix_ && _size > RSFRAME_MAX_FRAME_SIZE_DFLT) {
        errno = EMSGSIZE;
        return -1;
    }
    return 0;
}

int rsframe::frame_encoder_t::encode (unsigned char *buffer_,
                                      size_t size_,
                                      bool length_prefix_)
{
    if (check_prefix (length_prefix_) == -1)
        return -1;

    const size_t skip = length_prefix_ ? 0 : RSFRAME_LENGTH_PREFIX_SIZE;
    const size_t total = _size + (length_prefix_ ? RSFRAME_LENGTH_PREFIX_SIZE : 0);
    if (size_ < total) {
        errno = ENOBUFS;
        return -1;
    }

    unsigned char *pos = buffer_;
    memcpy (pos, _tmp_buf + skip, _head_size - skip);
    pos += _head_size - skip;
    if (_fields.has_metadata && _fields.metadata_size > 0) {
        memcpy (pos, _fields.metadata, _fields.metadata_size);
        pos += _fields.metadata_size;
    }
    if (_fields.data_size > 0) {
        memcpy (pos, _fields.data, _fields.data_size);
        pos += _fields.data_size;
    }

    rsframe_assert (static_cast<size_t> (pos - buffer_) == total);
    return static_cast<int> (total);
}

int rsframe::frame_encoder_t::encode (std::vector<unsigned char> &out_,
                                      bool length_prefix_)
{
    if (check_prefix (length_prefix_) == -1)
        return -1;

    const size_t offset = out_.size ();
    out_.resize (offset + _size
                 + (length_prefix_ ? RSFRAME_LENGTH_PREFIX_SIZE : 0));
    return encode (&out_[offset], out_.size () - offset, length_prefix_);
}

int rsframe::frame_encoder_t::gather (
  std::vector<boost::asio::const_buffer> &out_, bool length_prefix_)
{
    if (check_prefix (length_prefix_) == -1)
        return -1;

    const size_t skip = length_prefix_ ? 0 : RSFRAME_LENGTH_PREFIX_SIZE;
    out_.push_back (
      boost::asio::const_buffer (_tmp_buf + skip, _head_size - skip));
    if (_fields.has_metadata && _fields.metadata_size > 0)
        out_.push_back (
          boost::asio::const_buffer (_fields.metadata, _fields.metadata_size));
    if (_fields.data_size > 0)
        out_.push_back (
          boost::asio::const_buffer (_fields.data, _fields.data_size));
    return static_cast<int> (_size + (length_prefix_ ? RSFRAME_LENGTH_PREFIX_SIZE : 0));
}

int rsframe::encode_frame (std::vector<unsigned char> &out_,
                           const frame_fields_t &fields_,
                           bool length_prefix_)
{
    frame_encoder_t encoder;
    if (encoder.load (fields_) == -1)
        return -1;
    return encoder.encode (out_, length_prefix_);
}

namespace
{
void set_metadata (rsframe::frame_fields_t &fields_,
                   const boost::asio::const_buffer *metadata_)
{
    if (metadata_) {
        fields_.has_metadata = 1;
        fields_.metadata = metadata_->data ();
        fields_.metadata_size = metadata_->size ();
    }
}

void set_data (rsframe::frame_fields_t &fields_,
               const boost::asio::const_buffer &data_)
{
    fields_.data = data_.data ();
    fields_.data_size = data_.size ();
}

int encode_request (std::vector<unsigned char> &out_,
                    int type_,
                    uint32_t stream_id_,
                    uint32_t initial_request_n_,
                    const boost::asio::const_buffer *metadata_,
                    const boost::asio::const_buffer &data_,
                    int flags_)
{
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, type_, stream_id_);
    fields.flags = flags_;
    fields.request_n = initial_request_n_;
    set_metadata (fields, metadata_);
    set_data (fields, data_);
    return rsframe::encode_frame (out_, fields);
}
}

int rsframe::encode_request_response (
  std::vector<unsigned char> &out_,
  uint32_t stream_id_,
  const boost::asio::const_buffer *metadata_,
  const boost::asio::const_buffer &data_,
  int flags_)
{
    return encode_request (out_, RSFRAME_TYPE_REQUEST_RESPONSE, stream_id_, 0,
                           metadata_, data_, flags_);
}

int rsframe::encode_request_fnf (std::vector<unsigned char> &out_,
                                 uint32_t stream_id_,
                                 const boost::asio::const_buffer *metadata_,
                                 const boost::asio::const_buffer &data_,
                                 int flags_)
{
    return encode_request (out_, RSFRAME_TYPE_REQUEST_FNF, stream_id_, 0,
                           metadata_, data_, flags_);
}

int rsframe::encode_request_stream (
  std::vector<unsigned char> &out_,
  uint32_t stream_id_,
  uint32_t initial_request_n_,
  const boost::asio::const_buffer *metadata_,
  const boost::asio::const_buffer &data_,
  int flags_)
{
    return encode_request (out_, RSFRAME_TYPE_REQUEST_STREAM, stream_id_,
                           initial_request_n_, metadata_, data_, flags_);
}

int rsframe::encode_request_channel (
  std::vector<unsigned char> &out_,
  uint32_t stream_id_,
  uint32_t initial_request_n_,
  const boost::asio::const_buffer *metadata_,
  const boost::asio::const_buffer &data_,
  int flags_)
{
    return encode_request (out_, RSFRAME_TYPE_REQUEST_CHANNEL, stream_id_,
                           initial_request_n_, metadata_, data_, flags_);
}

int rsframe::encode_request_n (std::vector<unsigned char> &out_,
                               uint32_t stream_id_,
                               uint32_t request_n_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_REQUEST_N, stream_id_);
    fields.request_n = request_n_;
    return encode_frame (out_, fields);
}

int rsframe::encode_cancel (std::vector<unsigned char> &out_,
                            uint32_t stream_id_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_CANCEL, stream_id_);
    return encode_frame (out_, fields);
}

int rsframe::encode_payload (std::vector<unsigned char> &out_,
                             uint32_t stream_id_,
                             int flags_,
                             const boost::asio::const_buffer *metadata_,
                             const boost::asio::const_buffer &data_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_PAYLOAD, stream_id_);
    fields.flags = flags_;
    set_metadata (fields, metadata_);
    set_data (fields, data_);
    return encode_frame (out_, fields);
}

int rsframe::encode_error (std::vector<unsigned char> &out_,
                           uint32_t stream_id_,
                           uint32_t error_code_,
                           const boost::asio::const_buffer &data_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_ERROR, stream_id_);
    fields.error_code = error_code_;
    set_data (fields, data_);
    return encode_frame (out_, fields);
}

int rsframe::encode_metadata_push (std::vector<unsigned char> &out_,
                                   const boost::asio::const_buffer &metadata_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_METADATA_PUSH, 0);
    set_metadata (fields, &metadata_);
    return encode_frame (out_, fields);
}

int rsframe::encode_keepalive (std::vector<unsigned char> &out_,
                               uint64_t last_position_,
                               bool respond_,
                               const boost::asio::const_buffer &data_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_KEEPALIVE, 0);
    fields.flags = respond_ ? RSFRAME_FLAG_RESPOND : 0;
    fields.position = last_position_;
    set_data (fields, data_);
    return encode_frame (out_, fields);
}

int rsframe::encode_lease (std::vector<unsigned char> &out_,
                           uint32_t ttl_,
                           uint32_t requests_,
                           const boost::asio::const_buffer *metadata_)
{
    frame_fields_t fields;
    init_fields (&fields, RSFRAME_TYPE_LEASE, 0);
    fields.ttl = ttl_;
    fields.lease_requests = requests_;
    set_metadata (fields, metadata_);
    return encode_frame (out_, fields);
}
