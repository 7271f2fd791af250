/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_DEBUG_COUNTERS_H_INCLUDED__
#define __RSFRAME_DEBUG_COUNTERS_H_INCLUDED__

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Debug counters - only active when RSFRAME_DEBUG_COUNTERS is defined
// These are for testing purposes only, not part of the public API

#if defined(RSFRAME_DEBUG_COUNTERS)

// Frames successfully decoded
size_t rsframe_debug_get_decoded_count();

// Frames rejected by the decoder
size_t rsframe_debug_get_decode_error_count();

// Fragments held by assemblers while a chain was open
size_t rsframe_debug_get_fragment_count();

// Multi-frame messages completed by assemblers
size_t rsframe_debug_get_reassembled_count();

// Frames that went through the stream decoder's copy path
size_t rsframe_debug_get_stream_copy_count();

// Reset all counters
void rsframe_debug_reset_counters();

// Increment functions (internal use)
void rsframe_debug_inc_decoded_count();
void rsframe_debug_inc_decode_error_count();
void rsframe_debug_inc_fragment_count();
void rsframe_debug_inc_reassembled_count();
void rsframe_debug_inc_stream_copy_count();

#else

// Stub macros when counters are disabled
#define rsframe_debug_get_decoded_count() 0
#define rsframe_debug_get_decode_error_count() 0
#define rsframe_debug_get_fragment_count() 0
#define rsframe_debug_get_reassembled_count() 0
#define rsframe_debug_get_stream_copy_count() 0
#define rsframe_debug_reset_counters() ((void)0)
#define rsframe_debug_inc_decoded_count() ((void)0)
#define rsframe_debug_inc_decode_error_count() ((void)0)
#define rsframe_debug_inc_fragment_count() ((void)0)
#define rsframe_debug_inc_reassembled_count() ((void)0)
#define rsframe_debug_inc_stream_copy_count() ((void)0)

#endif // RSFRAME_DEBUG_COUNTERS

#ifdef __cplusplus
}
#endif

#endif // __RSFRAME_DEBUG_COUNTERS_H_INCLUDED__
