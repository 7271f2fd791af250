/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>

#include "core/options.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static int option_invalid ()
{
#if defined(RSFRAME_ACT_MILITANT)
    rsframe_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

int rsframe::do_getopt (void *const optval_,
                        size_t *const optvallen_,
                        const void *value_,
                        const size_t value_len_)
{
    if (*optvallen_ < value_len_) {
        return option_invalid ();
    }
    memcpy (optval_, value_, value_len_);
    memset (static_cast<char *> (optval_) + value_len_, 0,
            *optvallen_ - value_len_);
    *optvallen_ = value_len_;
    return 0;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return option_invalid ();
}

int rsframe::do_setopt_int_as_bool_strict (const void *const optval_,
                                           const size_t optvallen_,
                                           bool *const out_value_)
{
    int value = -1;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;
    if (value == 0 || value == 1) {
        *out_value_ = (value != 0);
        return 0;
    }
    return option_invalid ();
}

rsframe::options_t::options_t () :
    max_frame_size (RSFRAME_MAX_FRAME_SIZE_DFLT),
    max_reassembly_size (-1),
    interleave_fragments (true),
    strict_stream_ids (false)
{
}

int rsframe::options_t::setopt (int option_,
                                const void *optval_,
                                size_t optvallen_)
{
    if (optval_ == NULL)
        return option_invalid ();

    const bool is_int = (optvallen_ == sizeof (int));
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case RSFRAME_MAX_FRAME_SIZE:
            //  The stream decoder needs at least a frame header.
            if (is_int && value >= RSFRAME_HEADER_SIZE
                && value <= RSFRAME_MAX_FRAME_SIZE_DFLT) {
                max_frame_size = value;
                return 0;
            }
            break;

        case RSFRAME_MAX_REASSEMBLY_SIZE: {
            int64_t limit = 0;
            if (do_setopt (optval_, optvallen_, &limit) == -1)
                return -1;
            if (limit < -1)
                break;
            max_reassembly_size = limit;
            return 0;
        }

        case RSFRAME_INTERLEAVE_FRAGMENTS:
            return do_setopt_int_as_bool_strict (optval_, optvallen_,
                                                 &interleave_fragments);

        case RSFRAME_STRICT_STREAM_IDS:
            return do_setopt_int_as_bool_strict (optval_, optvallen_,
                                                 &strict_stream_ids);

        default:
            break;
    }

    return option_invalid ();
}

int rsframe::options_t::getopt (int option_,
                                void *optval_,
                                size_t *optvallen_) const
{
    if (optval_ == NULL || optvallen_ == NULL)
        return option_invalid ();

    const bool is_int = (*optvallen_ == sizeof (int));
    int *value = static_cast<int *> (optval_);

    switch (option_) {
        case RSFRAME_MAX_FRAME_SIZE:
            if (is_int) {
                *value = max_frame_size;
                return 0;
            }
            break;

        case RSFRAME_MAX_REASSEMBLY_SIZE:
            return do_getopt (optval_, optvallen_, &max_reassembly_size,
                              sizeof (max_reassembly_size));

        case RSFRAME_INTERLEAVE_FRAGMENTS:
            if (is_int) {
                *value = interleave_fragments ? 1 : 0;
                return 0;
            }
            break;

        case RSFRAME_STRICT_STREAM_IDS:
            if (is_int) {
                *value = strict_stream_ids ? 1 : 0;
                return 0;
            }
            break;

        default:
            break;
    }

    return option_invalid ();
}
