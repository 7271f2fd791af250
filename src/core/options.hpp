/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_OPTIONS_HPP_INCLUDED__
#define __RSFRAME_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/rsframe.h"

namespace rsframe
{
//  Tunables shared by the stateful components of one connection.
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Largest encoded frame accepted by the stream decoder, length prefix
    //  excluded.
    int max_frame_size;

    //  Bytes buffered per fragment chain; -1 means unlimited.
    int64_t max_reassembly_size;

    //  Allow fragment chains of different streams to interleave.
    bool interleave_fragments;

    //  Reject frames whose stream id does not match their type's scope.
    bool strict_stream_ids;
};

int do_getopt (void *optval_,
               size_t *optvallen_,
               const void *value_,
               size_t value_len_);

int do_setopt_int_as_bool_strict (const void *optval_,
                                  size_t optvallen_,
                                  bool *out_value_);
}

#endif
