/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/reassembler.hpp"
#include "utils/debug.hpp"
#include "utils/debug_counters.h"
#include "utils/err.hpp"

static const uint32_t reassembler_tag_value = 0x5ea55e3b;

namespace
{
bool carries_request_n (const rsframe::frame_type_info_t &info_)
{
    return info_.has_initial_request_n ()
           || info_.fixed == rsframe::fixed_request_n;
}

const unsigned char *bytes_of (const boost::asio::const_buffer &buf_)
{
    return static_cast<const unsigned char *> (buf_.data ());
}
}

rsframe::reassembler_t::reassembler_t () : _tag (reassembler_tag_value)
{
}

rsframe::reassembler_t::reassembler_t (const options_t &options_) :
    _options (options_),
    _tag (reassembler_tag_value)
{
}

rsframe::reassembler_t::~reassembler_t ()
{
    _tag = 0xdeadbeef;
}

bool rsframe::reassembler_t::check_tag () const
{
    return _tag == reassembler_tag_value;
}

int rsframe::reassembler_t::setopt (int option_,
                                    const void *optval_,
                                    size_t optvallen_)
{
    return _options.setopt (option_, optval_, optvallen_);
}

int rsframe::reassembler_t::getopt (int option_,
                                    void *optval_,
                                    size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}

int rsframe::reassembler_t::push (const frame_t &frame_, message_t *msg_)
{
    rsframe_assert (frame_.valid ());

    const uint32_t stream_id = frame_.stream_id ();
    chains_t::iterator it = _chains.find (stream_id);

    //  Without interleaving only one chain may be open at a time. Frames
    //  that do not open a chain still pass.
    if (!_options.interleave_fragments && stream_id != 0
        && it == _chains.end () && !_chains.empty ()
        && frame_.has_follows ()) {
        RSFRAME_DBG_CHAIN ("stream %u: fragment while stream %u is open",
                           stream_id, _chains.begin ()->first);
        errno = EINTERLEAVED;
        return -1;
    }

    if (it == _chains.end ()) {
        if (!frame_.has_follows ()) {
            pass_through (frame_, msg_);
            return 1;
        }
        if (!frame_.info ().is_fragmentable ()) {
            RSFRAME_DBG_CHAIN ("stream %u: FOLLOWS on %s", stream_id,
                               frame_.info ().name);
            errno = EMALFORMED;
            return -1;
        }

        chain_t chain;
        chain.info = &frame_.info ();
        chain.flags = frame_.flags ()
                      & ~(RSFRAME_FLAG_FOLLOWS | RSFRAME_FLAG_METADATA
                          | RSFRAME_FLAG_COMPLETE);
        chain.has_request_n = carries_request_n (frame_.info ());
        chain.request_n = 0;
        if (chain.has_request_n) {
            const int rc = frame_.request_n (&chain.request_n);
            errno_assert (rc == 0);
        }
        chain.has_metadata = false;
        chain.fragments = 0;

        it = _chains.insert (chains_t::value_type (stream_id, chain)).first;
        RSFRAME_DBG_CHAIN ("stream %u: %s chain opened", stream_id,
                           chain.info->name);
        if (append (it->second, frame_) == -1) {
            _chains.erase (it);
            return -1;
        }
        rsframe_debug_inc_fragment_count ();
        return 0;
    }

    //  Open chain on this stream.
    const int type = frame_.type ();
    if (type == RSFRAME_TYPE_CANCEL || type == RSFRAME_TYPE_ERROR) {
        RSFRAME_DBG_CHAIN ("stream %u: chain discarded by %s", stream_id,
                           frame_.info ().name);
        _chains.erase (it);
        pass_through (frame_, msg_);
        return 1;
    }
    if (type != RSFRAME_TYPE_PAYLOAD) {
        RSFRAME_DBG_CHAIN ("stream %u: %s inside a fragment chain", stream_id,
                           frame_.info ().name);
        _chains.erase (it);
        errno = EMALFORMED;
        return -1;
    }
    if (append (it->second, frame_) == -1) {
        _chains.erase (it);
        return -1;
    }
    if (frame_.has_follows ()) {
        rsframe_debug_inc_fragment_count ();
        return 0;
    }

    complete (it->second, stream_id, frame_.flags (), msg_);
    _chains.erase (it);
    rsframe_debug_inc_reassembled_count ();
    return 1;
}

int rsframe::reassembler_t::append (chain_t &chain_, const frame_t &frame_)
{
    boost::asio::const_buffer metadata;
    boost::asio::const_buffer data;

    if (frame_.has_metadata ()) {
        const int rc = frame_.metadata (&metadata);
        errno_assert (rc == 0);
        chain_.has_metadata = true;
    }
    if (frame_.info ().can_have_data ()) {
        const int rc = frame_.data (&data);
        errno_assert (rc == 0);
    }

    const size_t added = metadata.size () + data.size ();
    const int64_t limit = _options.max_reassembly_size;
    if (limit >= 0) {
        const uint64_t buffered =
          chain_.metadata.size () + chain_.data.size ();
        if (buffered + added > static_cast<uint64_t> (limit)) {
            RSFRAME_DBG_CHAIN ("stream %u: chain exceeds %lld bytes",
                               frame_.stream_id (),
                               static_cast<long long> (limit));
            errno = EMSGSIZE;
            return -1;
        }
    }

    chain_.metadata.insert (chain_.metadata.end (), bytes_of (metadata),
                            bytes_of (metadata) + metadata.size ());
    chain_.data.insert (chain_.data.end (), bytes_of (data),
                        bytes_of (data) + data.size ());
    chain_.fragments++;
    return 0;
}

void rsframe::reassembler_t::pass_through (const frame_t &frame_,
                                           message_t *msg_)
{
    const frame_type_info_t &info = frame_.info ();

    msg_->stream_id = frame_.stream_id ();
    msg_->info = &info;
    msg_->flags = frame_.flags ();
    msg_->has_metadata = frame_.has_metadata () && !info.is_opaque ();
    msg_->metadata = boost::asio::const_buffer ();
    if (msg_->has_metadata) {
        const int rc = frame_.metadata (&msg_->metadata);
        errno_assert (rc == 0);
    }
    msg_->has_data = info.can_have_data ();
    msg_->data = boost::asio::const_buffer ();
    if (msg_->has_data) {
        const int rc = frame_.data (&msg_->data);
        errno_assert (rc == 0);
    }
    msg_->has_request_n = carries_request_n (info);
    msg_->request_n = 0;
    if (msg_->has_request_n) {
        const int rc = frame_.request_n (&msg_->request_n);
        errno_assert (rc == 0);
    }
    msg_->fragments = 1;
}

void rsframe::reassembler_t::complete (chain_t &chain_,
                                       uint32_t stream_id_,
                                       int last_flags_,
                                       message_t *msg_)
{
    _metadata.swap (chain_.metadata);
    _data.swap (chain_.data);

    msg_->stream_id = stream_id_;
    msg_->info = chain_.info;
    msg_->flags = chain_.flags | (last_flags_ & RSFRAME_FLAG_COMPLETE);
    if (chain_.has_metadata)
        msg_->flags |= RSFRAME_FLAG_METADATA;
    msg_->has_metadata = chain_.has_metadata;
    msg_->metadata = chain_.has_metadata
                       ? boost::asio::const_buffer (_metadata.data (),
                                                    _metadata.size ())
                       : boost::asio::const_buffer ();
    msg_->has_data = chain_.info->can_have_data ();
    msg_->data = boost::asio::const_buffer (_data.data (), _data.size ());
    msg_->has_request_n = chain_.has_request_n;
    msg_->request_n = chain_.request_n;
    msg_->fragments = chain_.fragments;

    RSFRAME_DBG_CHAIN ("stream %u: %s reassembled from %d frames", stream_id_,
                       chain_.info->name, chain_.fragments);
}

void rsframe::reassembler_t::cancel (uint32_t stream_id_)
{
    if (_chains.erase (stream_id_) > 0)
        RSFRAME_DBG_CHAIN ("stream %u: chain cancelled", stream_id_);
}

int rsframe::reassembler_t::finish ()
{
    if (_chains.empty ())
        return 0;

    RSFRAME_DBG_CHAIN ("%zu chains open at end of connection",
                       _chains.size ());
    _chains.clear ();
    errno = EINCOMPLETE;
    return -1;
}
