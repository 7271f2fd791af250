/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_type.hpp"
#include "utils/err.hpp"

namespace
{
const unsigned int request_caps = rsframe::frame_cap_data
                                  | rsframe::frame_cap_metadata
                                  | rsframe::frame_cap_fragmentable;

//  Indexed by type code; entries with a NULL name are not frame types.
const rsframe::frame_type_info_t frame_types[] = {
  {0x00, NULL, 0, rsframe::fixed_none, 0, rsframe::scope_any},
  {RSFRAME_TYPE_SETUP, "SETUP", rsframe::frame_cap_opaque, rsframe::fixed_none,
   0, rsframe::scope_connection},
  {RSFRAME_TYPE_LEASE, "LEASE", rsframe::frame_cap_metadata,
   rsframe::fixed_lease, 8, rsframe::scope_connection},
  {RSFRAME_TYPE_KEEPALIVE, "KEEPALIVE", rsframe::frame_cap_data,
   rsframe::fixed_position, 8, rsframe::scope_connection},
  {RSFRAME_TYPE_REQUEST_RESPONSE, "REQUEST_RESPONSE", request_caps,
   rsframe::fixed_none, 0, rsframe::scope_stream},
  {RSFRAME_TYPE_REQUEST_FNF, "REQUEST_FNF", request_caps, rsframe::fixed_none,
   0, rsframe::scope_stream},
  {RSFRAME_TYPE_REQUEST_STREAM, "REQUEST_STREAM",
   request_caps | rsframe::frame_cap_initial_request_n, rsframe::fixed_none, 0,
   rsframe::scope_stream},
  {RSFRAME_TYPE_REQUEST_CHANNEL, "REQUEST_CHANNEL",
   request_caps | rsframe::frame_cap_initial_request_n, rsframe::fixed_none, 0,
   rsframe::scope_stream},
  {RSFRAME_TYPE_REQUEST_N, "REQUEST_N", 0, rsframe::fixed_request_n, 4,
   rsframe::scope_stream},
  {RSFRAME_TYPE_CANCEL, "CANCEL", 0, rsframe::fixed_none, 0,
   rsframe::scope_stream},
  {RSFRAME_TYPE_PAYLOAD, "PAYLOAD",
   rsframe::frame_cap_data | rsframe::frame_cap_metadata
     | rsframe::frame_cap_fragmentable,
   rsframe::fixed_none, 0, rsframe::scope_stream},
  {RSFRAME_TYPE_ERROR, "ERROR", rsframe::frame_cap_data,
   rsframe::fixed_error_code, 4, rsframe::scope_any},
  {RSFRAME_TYPE_METADATA_PUSH, "METADATA_PUSH", rsframe::frame_cap_metadata,
   rsframe::fixed_none, 0, rsframe::scope_connection},
  {RSFRAME_TYPE_RESUME, "RESUME", rsframe::frame_cap_opaque,
   rsframe::fixed_none, 0, rsframe::scope_connection},
  {RSFRAME_TYPE_RESUME_OK, "RESUME_OK", rsframe::frame_cap_opaque,
   rsframe::fixed_none, 0, rsframe::scope_connection},
};

const rsframe::frame_type_info_t ext_type = {
  RSFRAME_TYPE_EXT, "EXT", rsframe::frame_cap_opaque, rsframe::fixed_none, 0,
  rsframe::scope_any};

const size_t frame_types_count = sizeof frame_types / sizeof frame_types[0];
}

const rsframe::frame_type_info_t *rsframe::find_frame_type (int type_)
{
    if (type_ == RSFRAME_TYPE_EXT)
        return &ext_type;
    if (type_ > 0 && static_cast<size_t> (type_) < frame_types_count) {
        const frame_type_info_t *info = &frame_types[type_];
        rsframe_assert (info->type == type_);
        return info;
    }
    errno = EUNKNOWNTYPE;
    return NULL;
}

int rsframe::has_initial_request_n (int type_)
{
    const frame_type_info_t *info = find_frame_type (type_);
    if (!info)
        return -1;
    return info->has_initial_request_n () ? 1 : 0;
}

int rsframe::can_have_data (int type_)
{
    const frame_type_info_t *info = find_frame_type (type_);
    if (!info)
        return -1;
    return info->can_have_data () ? 1 : 0;
}

int rsframe::can_have_metadata (int type_)
{
    const frame_type_info_t *info = find_frame_type (type_);
    if (!info)
        return -1;
    return info->can_have_metadata () ? 1 : 0;
}

int rsframe::is_fragmentable (int type_)
{
    const frame_type_info_t *info = find_frame_type (type_);
    if (!info)
        return -1;
    return info->is_fragmentable () ? 1 : 0;
}
