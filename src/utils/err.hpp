/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_ERR_HPP_INCLUDED__
#define __RSFRAME_ERR_HPP_INCLUDED__

#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "utils/likely.hpp"

//  rsframe-specific error codes are defined in rsframe.h

namespace rsframe
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void rsframe_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void rsframe_abort (const char *errmsg_);
#endif
#else
void rsframe_abort (const char *errmsg_);
#endif
}

//  This macro works in exactly the same way as the normal assert. It is used
//  in its stead because it reports through the library's abort path.
#define rsframe_assert(x)                                                      \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            rsframe::rsframe_abort (#x);                                       \
        }                                                                      \
    } while (false)

//  Provides convenient way to check for errno-style errors.
#define errno_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            const char *errstr = strerror (errno);                             \
            fprintf (stderr, "%s (%s:%d)\n", errstr, __FILE__, __LINE__);      \
            fflush (stderr);                                                   \
            rsframe::rsframe_abort (errstr);                                   \
        }                                                                      \
    } while (false)

#endif
