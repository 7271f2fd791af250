/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/debug_counters.h"

#if defined(RSFRAME_DEBUG_COUNTERS)

#include <atomic>

static std::atomic<size_t> s_decoded_count{0};
static std::atomic<size_t> s_decode_error_count{0};
static std::atomic<size_t> s_fragment_count{0};
static std::atomic<size_t> s_reassembled_count{0};
static std::atomic<size_t> s_stream_copy_count{0};

extern "C" {

size_t rsframe_debug_get_decoded_count()
{
    return s_decoded_count.load(std::memory_order_relaxed);
}

size_t rsframe_debug_get_decode_error_count()
{
    return s_decode_error_count.load(std::memory_order_relaxed);
}

size_t rsframe_debug_get_fragment_count()
{
    return s_fragment_count.load(std::memory_order_relaxed);
}

size_t rsframe_debug_get_reassembled_count()
{
    return s_reassembled_count.load(std::memory_order_relaxed);
}

size_t rsframe_debug_get_stream_copy_count()
{
    return s_stream_copy_count.load(std::memory_order_relaxed);
}

void rsframe_debug_reset_counters()
{
    s_decoded_count.store(0, std::memory_order_relaxed);
    s_decode_error_count.store(0, std::memory_order_relaxed);
    s_fragment_count.store(0, std::memory_order_relaxed);
    s_reassembled_count.store(0, std::memory_order_relaxed);
    s_stream_copy_count.store(0, std::memory_order_relaxed);
}

void rsframe_debug_inc_decoded_count()
{
    s_decoded_count.fetch_add(1, std::memory_order_relaxed);
}

void rsframe_debug_inc_decode_error_count()
{
    s_decode_error_count.fetch_add(1, std::memory_order_relaxed);
}

void rsframe_debug_inc_fragment_count()
{
    s_fragment_count.fetch_add(1, std::memory_order_relaxed);
}

void rsframe_debug_inc_reassembled_count()
{
    s_reassembled_count.fetch_add(1, std::memory_order_relaxed);
}

void rsframe_debug_inc_stream_copy_count()
{
    s_stream_copy_count.fetch_add(1, std::memory_order_relaxed);
}

} // extern "C"

#endif // RSFRAME_DEBUG_COUNTERS
