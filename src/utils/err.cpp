/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *rsframe::errno_to_string (int errno_)
{
    switch (errno_) {
        case EFSM:
            return "Operation cannot be accomplished in current state";
        case EMALFORMED:
            return "Malformed frame";
        case EUNKNOWNTYPE:
            return "Unknown frame type";
        case ENOMETADATA:
            return "Frame carries no metadata";
        case EDATANOTSUP:
            return "Frame type cannot carry data";
        case EREQNNOTSUP:
            return "Frame type carries no request-N";
        case EPAYLOADSIZE:
            return "Inconsistent frame payload size";
        case EINTERLEAVED:
            return "Interleaved fragments";
        case EINCOMPLETE:
            return "Incomplete fragment chain";
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror (errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void rsframe::rsframe_abort (const char *errmsg_)
{
    LIBRSFRAME_UNUSED (errmsg_);
    abort ();
}
