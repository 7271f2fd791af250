/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/stream_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/debug_counters.h"
#include "utils/err.hpp"

#include <algorithm>
#include <string.h>

static const uint32_t stream_decoder_tag_value = 0x3dc0de11;

rsframe::stream_decoder_t::stream_decoder_t () :
    _read_pos (NULL),
    _to_read (0),
    _next (NULL),
    _failed (false),
    _tag (stream_decoder_tag_value)
{
    next_step (_tmpbuf, sizeof (_tmpbuf), &stream_decoder_t::length_ready);
}

rsframe::stream_decoder_t::stream_decoder_t (const options_t &options_) :
    _options (options_),
    _read_pos (NULL),
    _to_read (0),
    _next (NULL),
    _failed (false),
    _tag (stream_decoder_tag_value)
{
    next_step (_tmpbuf, sizeof (_tmpbuf), &stream_decoder_t::length_ready);
}

rsframe::stream_decoder_t::~stream_decoder_t ()
{
    _tag = 0xdeadbeef;
}

bool rsframe::stream_decoder_t::check_tag () const
{
    return _tag == stream_decoder_tag_value;
}

int rsframe::stream_decoder_t::setopt (int option_,
                                       const void *optval_,
                                       size_t optvallen_)
{
    return _options.setopt (option_, optval_, optvallen_);
}

int rsframe::stream_decoder_t::getopt (int option_,
                                       void *optval_,
                                       size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}

void rsframe::stream_decoder_t::reset ()
{
    _frame.reset ();
    _body.clear ();
    _failed = false;
    next_step (_tmpbuf, sizeof (_tmpbuf), &stream_decoder_t::length_ready);
}

int rsframe::stream_decoder_t::decode (const unsigned char *data_,
                                       size_t size_,
                                       size_t *consumed_)
{
    *consumed_ = 0;

    if (unlikely (_failed)) {
        errno = EFSM;
        return -1;
    }

    _frame.reset ();

    while (*consumed_ < size_) {
        const size_t to_copy = std::min (_to_read, size_ - *consumed_);
        memcpy (_read_pos, data_ + *consumed_, to_copy);
        _read_pos += to_copy;
        _to_read -= to_copy;
        *consumed_ += to_copy;

        if (_to_read == 0) {
            const int rc = (this->*_next) (data_ + *consumed_,
                                           size_ - *consumed_, consumed_);
            if (unlikely (rc == -1)) {
                _failed = true;
                _frame.reset ();
                return -1;
            }
            if (rc == 1)
                return 1;
        }
    }

    return 0;
}

int rsframe::stream_decoder_t::length_ready (const unsigned char *read_from_,
                                             size_t available_,
                                             size_t *consumed_)
{
    const uint32_t frame_size = get_uint24 (_tmpbuf);

    if (unlikely (frame_size == 0
                  || frame_size
                       > static_cast<uint32_t> (_options.max_frame_size))) {
        RSFRAME_DBG_STREAM ("frame length %u outside 1..%d", frame_size,
                            _options.max_frame_size);
        errno = EMSGSIZE;
        return -1;
    }

    //  Whole frame available in the caller's buffer: decode in place.
    if (frame_size <= available_) {
        next_step (_tmpbuf, sizeof (_tmpbuf), &stream_decoder_t::length_ready);
        if (_frame.init (read_from_, frame_size, _options.strict_stream_ids)
            == -1)
            return -1;
        *consumed_ += frame_size;
        return 1;
    }

    _body.resize (frame_size);
    next_step (&_body[0], frame_size, &stream_decoder_t::body_ready);
    return 0;
}

int rsframe::stream_decoder_t::body_ready (const unsigned char *,
                                           size_t,
                                           size_t *)
{
    next_step (_tmpbuf, sizeof (_tmpbuf), &stream_decoder_t::length_ready);
    rsframe_debug_inc_stream_copy_count ();
    RSFRAME_DBG_STREAM ("frame of %zu bytes collected across reads",
                        _body.size ());
    return _frame.init (&_body[0], _body.size (), _options.strict_stream_ids)
               == -1
             ? -1
             : 1;
}
