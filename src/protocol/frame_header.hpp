/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_FRAME_HEADER_HPP_INCLUDED__
#define __RSFRAME_FRAME_HEADER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/rsframe.h"
#include "protocol/frame_type.hpp"

namespace rsframe
{
//  Header layout (6 bytes):
//    0..3  stream id, big-endian, top bit reserved
//    4..5  type (high 6 bits) and flags (low 10 bits), big-endian
enum
{
    header_size = RSFRAME_HEADER_SIZE,
    header_type_shift = 10,
    header_flags_mask = RSFRAME_FLAG_MASK,
    metadata_length_size = 3,
    request_n_size = 4
};

struct frame_header_t
{
    uint32_t stream_id;
    const frame_type_info_t *info;
    int flags;

    int type () const { return info->type; }
    bool has_metadata () const { return (flags & RSFRAME_FLAG_METADATA) != 0; }
    bool has_follows () const { return (flags & RSFRAME_FLAG_FOLLOWS) != 0; }
};

//  Writes the header into buffer_. Returns header_size, or -1 with errno
//  set to EINVAL (reserved stream id bit or stray flag bits), EUNKNOWNTYPE
//  or ENOBUFS.
int encode_header (unsigned char *buffer_,
                   size_t size_,
                   uint32_t stream_id_,
                   int type_,
                   int flags_);

//  Parses the header at buffer_. Returns 0, or -1 with errno set to
//  EMALFORMED; header_ is only written on success.
int decode_header (const unsigned char *buffer_,
                   size_t size_,
                   frame_header_t *header_);
}

#endif
