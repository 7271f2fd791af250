/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_STREAM_ID_HPP_INCLUDED__
#define __RSFRAME_STREAM_ID_HPP_INCLUDED__

#include <stdint.h>

#include "protocol/frame_type.hpp"

namespace rsframe
{
//  Stream identifiers are 31-bit. Zero addresses the connection itself,
//  odd identifiers are allocated by the client, even ones by the server.
//  Allocation is up to the stream management layer; these are
//  classification queries only.

const uint32_t stream_id_reserved_bit = 0x80000000u;

inline bool stream_id_valid (uint32_t stream_id_)
{
    return (stream_id_ & stream_id_reserved_bit) == 0;
}

inline bool is_connection_level (uint32_t stream_id_)
{
    return stream_id_ == 0;
}

inline bool is_client_initiated (uint32_t stream_id_)
{
    return stream_id_ != 0 && (stream_id_ & 1u) == 1u;
}

inline bool is_server_initiated (uint32_t stream_id_)
{
    return stream_id_ != 0 && (stream_id_ & 1u) == 0u;
}

//  True if a frame of the given type may travel on stream_id_.
inline bool stream_scope_matches (const frame_type_info_t &info_,
                                  uint32_t stream_id_)
{
    switch (info_.scope) {
        case scope_connection:
            return is_connection_level (stream_id_);
        case scope_stream:
            return !is_connection_level (stream_id_);
        default:
            return true;
    }
}
}

#endif
