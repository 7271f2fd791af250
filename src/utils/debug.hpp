/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_DEBUG_HPP_INCLUDED__
#define __RSFRAME_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Debug tracing macros for the codec components
//  Enable with -DRSFRAME_DEBUG=1 during compilation
//
//  Usage:
//    RSFRAME_DBG_DECODE ("bad header: %d bytes", size);
//    RSFRAME_DBG_CHAIN ("stream %u: chain opened", stream_id);

#ifdef RSFRAME_DEBUG

#define RSFRAME_DBG(category, fmt, ...)                                        \
    do {                                                                       \
        fprintf (stderr, "[RSFRAME:" category "] " fmt "\n", ##__VA_ARGS__);   \
    } while (0)

#define RSFRAME_DBG_THIS(category, fmt, ...)                                   \
    do {                                                                       \
        fprintf (stderr, "[RSFRAME:" category ":%p] " fmt "\n",                \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define RSFRAME_DBG(category, fmt, ...) ((void) 0)
#define RSFRAME_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define RSFRAME_DBG_DECODE(fmt, ...) RSFRAME_DBG ("DECODE", fmt, ##__VA_ARGS__)
#define RSFRAME_DBG_ENCODE(fmt, ...) RSFRAME_DBG ("ENCODE", fmt, ##__VA_ARGS__)
#define RSFRAME_DBG_CHAIN(fmt, ...)                                            \
    RSFRAME_DBG_THIS ("CHAIN", fmt, ##__VA_ARGS__)
#define RSFRAME_DBG_STREAM(fmt, ...)                                           \
    RSFRAME_DBG_THIS ("STREAM", fmt, ##__VA_ARGS__)

#endif
