/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_FRAME_TYPE_HPP_INCLUDED__
#define __RSFRAME_FRAME_TYPE_HPP_INCLUDED__

#include <stddef.h>

namespace rsframe
{
//  Capability bits of a frame type.
enum
{
    frame_cap_initial_request_n = 0x01,
    frame_cap_data = 0x02,
    frame_cap_metadata = 0x04,
    frame_cap_fragmentable = 0x08,
    //  Body layout is not interpreted by the codec (setup, resume, ...).
    frame_cap_opaque = 0x20
};

//  Type-specific fields sitting between the header and the metadata block.
enum frame_fixed_t
{
    fixed_none,
    fixed_request_n,
    fixed_error_code,
    fixed_position,
    fixed_lease
};

//  Which stream identifiers a frame type may legally use.
enum frame_scope_t
{
    scope_connection,
    scope_stream,
    scope_any
};

struct frame_type_info_t
{
    int type;
    const char *name;
    unsigned int caps;
    frame_fixed_t fixed;
    size_t fixed_size;
    frame_scope_t scope;

    bool has_initial_request_n () const
    {
        return (caps & frame_cap_initial_request_n) != 0;
    }
    bool can_have_data () const { return (caps & frame_cap_data) != 0; }
    bool can_have_metadata () const
    {
        return (caps & frame_cap_metadata) != 0;
    }
    bool is_fragmentable () const
    {
        return (caps & frame_cap_fragmentable) != 0;
    }
    bool is_opaque () const { return (caps & frame_cap_opaque) != 0; }

    //  Bytes between the header and the metadata block.
    size_t prefix_size () const
    {
        return fixed_size + (has_initial_request_n () ? 4 : 0);
    }
};

//  Resolves a raw type code. Returns NULL and sets errno to EUNKNOWNTYPE
//  if the code is not part of the taxonomy.
const frame_type_info_t *find_frame_type (int type_);

//  Capability queries on raw codes. Return 1 or 0, or -1 with errno
//  EUNKNOWNTYPE.
int has_initial_request_n (int type_);
int can_have_data (int type_);
int can_have_metadata (int type_);
int is_fragmentable (int type_);
}

#endif
