/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/fragmenter.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <algorithm>

static const uint32_t fragmenter_tag_value = 0x2f7a91c3;

rsframe::fragmenter_t::fragmenter_t () :
    _info (NULL),
    _max_frame_size (0),
    _whole (false),
    _done (true),
    _count (0),
    _metadata_pos (0),
    _data_pos (0),
    _tag (fragmenter_tag_value)
{
    init_fields (&_fields, 0, 0);
}

rsframe::fragmenter_t::~fragmenter_t ()
{
    _tag = 0xdeadbeef;
}

bool rsframe::fragmenter_t::check_tag () const
{
    return _tag == fragmenter_tag_value;
}

int rsframe::fragmenter_t::init (const frame_fields_t &fields_,
                                 size_t max_frame_size_)
{
    _done = true;
    _count = 0;
    _metadata_pos = 0;
    _data_pos = 0;

    if (max_frame_size_ == 0 || max_frame_size_ > RSFRAME_MAX_FRAME_SIZE_DFLT) {
        errno = EINVAL;
        return -1;
    }

    //  Each frame carries at most max_frame_size_ bytes of either block, so
    //  the field set is validated with its blocks clamped to that size.
    frame_fields_t checked = fields_;
    checked.metadata_size = std::min (checked.metadata_size, max_frame_size_);
    checked.data_size = std::min (checked.data_size, max_frame_size_);
    frame_encoder_t encoder;
    if (encoder.load (checked) == -1)
        return -1;

    const frame_type_info_t *info = find_frame_type (fields_.type);
    rsframe_assert (info);

    //  The unclamped sizes decide whether the frame is split.
    const size_t metadata_size =
      fields_.has_metadata ? fields_.metadata_size : 0;
    const size_t data_size = info->can_have_data () ? fields_.data_size : 0;
    _whole = false;
    if (metadata_size <= max_frame_size_ && data_size <= max_frame_size_) {
        size_t whole_size =
          header_size + info->prefix_size () + metadata_size + data_size;
        if (fields_.has_metadata)
            whole_size += metadata_length_size;
        _whole = whole_size <= max_frame_size_;
    }
    if (!_whole) {
        if (!info->is_fragmentable ()) {
            RSFRAME_DBG_ENCODE ("%s exceeds %zu bytes and cannot be "
                                "fragmented",
                                info->name, max_frame_size_);
            errno = EMSGSIZE;
            return -1;
        }
        //  Room for the header, the fixed fields, a metadata length and
        //  at least one byte of content.
        if (max_frame_size_ < static_cast<size_t> (header_size)
                                + info->prefix_size () + metadata_length_size
                                + 1) {
            errno = EINVAL;
            return -1;
        }
    }

    _fields = fields_;
    if (!_fields.has_metadata)
        _fields.metadata_size = 0;
    if (!info->can_have_data ())
        _fields.data_size = 0;
    _info = info;
    _max_frame_size = max_frame_size_;
    _done = false;
    return 0;
}

int rsframe::fragmenter_t::prepare ()
{
    if (_whole)
        return _encoder.load (_fields);

    const bool first = _count == 0;
    const frame_type_info_t *info =
      first ? _info : find_frame_type (RSFRAME_TYPE_PAYLOAD);
    rsframe_assert (info);

    frame_fields_t fields;
    init_fields (&fields, info->type, _fields.stream_id);
    if (first) {
        fields = _fields;
        fields.flags &= ~(RSFRAME_FLAG_FOLLOWS | RSFRAME_FLAG_COMPLETE);
    } else
        fields.flags = RSFRAME_FLAG_NEXT;

    size_t budget = _max_frame_size - header_size - info->prefix_size ();

    const size_t metadata_left = _fields.metadata_size - _metadata_pos;
    size_t metadata_slice = 0;
    //  An empty metadata block is kept on the first frame.
    if (_fields.has_metadata && (metadata_left > 0 || first)) {
        budget -= metadata_length_size;
        metadata_slice = std::min (metadata_left, budget);
        budget -= metadata_slice;
        fields.has_metadata = 1;
        fields.metadata =
          static_cast<const unsigned char *> (_fields.metadata) + _metadata_pos;
        fields.metadata_size = metadata_slice;
    } else {
        fields.has_metadata = 0;
        fields.metadata = NULL;
        fields.metadata_size = 0;
    }

    const size_t data_left = _fields.data_size - _data_pos;
    const size_t data_slice = std::min (data_left, budget);
    if (data_slice > 0) {
        fields.data =
          static_cast<const unsigned char *> (_fields.data) + _data_pos;
        fields.data_size = data_slice;
    } else {
        fields.data = NULL;
        fields.data_size = 0;
    }

    _metadata_pos += metadata_slice;
    _data_pos += data_slice;

    const bool last = _metadata_pos == _fields.metadata_size
                      && _data_pos == _fields.data_size;
    if (!last)
        fields.flags |= RSFRAME_FLAG_FOLLOWS;
    else if (_fields.flags & RSFRAME_FLAG_COMPLETE)
        fields.flags |= RSFRAME_FLAG_COMPLETE;

    return _encoder.load (fields);
}

int rsframe::fragmenter_t::next (unsigned char *buffer_,
                                 size_t size_,
                                 bool length_prefix_)
{
    if (_done)
        return 0;

    //  Remember the position so a short buffer can be retried.
    const size_t metadata_pos = _metadata_pos;
    const size_t data_pos = _data_pos;

    int rc = prepare ();
    if (rc == 0)
        rc = _encoder.encode (buffer_, size_, length_prefix_);
    if (rc == -1) {
        _metadata_pos = metadata_pos;
        _data_pos = data_pos;
        return -1;
    }

    _count++;
    _done = _whole
            || (_metadata_pos == _fields.metadata_size
                && _data_pos == _fields.data_size);
    return rc;
}

int rsframe::fragmenter_t::next (std::vector<unsigned char> &out_,
                                 bool length_prefix_)
{
    if (_done)
        return 0;

    const size_t offset = out_.size ();
    out_.resize (offset + _max_frame_size
                 + (length_prefix_ ? RSFRAME_LENGTH_PREFIX_SIZE : 0));
    const int rc = next (&out_[offset], out_.size () - offset, length_prefix_);
    out_.resize (offset + (rc > 0 ? rc : 0));
    return rc;
}
