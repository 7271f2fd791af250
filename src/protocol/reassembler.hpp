/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_REASSEMBLER_HPP_INCLUDED__
#define __RSFRAME_REASSEMBLER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <vector>

#include <boost/asio/buffer.hpp>

#include "core/options.hpp"
#include "protocol/frame.hpp"
#include "utils/macros.hpp"

namespace rsframe
{
//  A logical frame as delivered by the reassembler. Single frames are
//  passed through as views into the frame's buffer; reassembled ones view
//  storage owned by the reassembler. Either way the views are valid until
//  the next call on the reassembler.
struct message_t
{
    uint32_t stream_id;
    const frame_type_info_t *info;
    int flags;
    bool has_metadata;
    boost::asio::const_buffer metadata;
    bool has_data;
    boost::asio::const_buffer data;
    bool has_request_n;
    uint32_t request_n;
    int fragments;
};

//  Per-connection fragment reassembly. Frames must be pushed in wire
//  order; chains of different streams are tracked independently.
class reassembler_t
{
  public:
    reassembler_t ();
    explicit reassembler_t (const options_t &options_);
    ~reassembler_t ();

    bool check_tag () const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Returns 1 when msg_ holds a complete message, 0 if the frame was
    //  buffered into an open chain, or -1 with errno set to EMALFORMED,
    //  EINTERLEAVED or EMSGSIZE.
    int push (const frame_t &frame_, message_t *msg_);

    //  Discards the open chain of stream_id_, if any.
    void cancel (uint32_t stream_id_);

    //  End of connection. Returns -1 with errno set to EINCOMPLETE if a
    //  chain was still open. All chains are discarded either way.
    int finish ();

    //  Number of open chains.
    size_t pending () const { return _chains.size (); }

  private:
    struct chain_t
    {
        const frame_type_info_t *info;
        int flags;
        bool has_request_n;
        uint32_t request_n;
        bool has_metadata;
        std::vector<unsigned char> metadata;
        std::vector<unsigned char> data;
        int fragments;
    };
    typedef std::map<uint32_t, chain_t> chains_t;

    //  Appends the content of frame_ to chain_. Fails with EMSGSIZE if the
    //  chain grows beyond the configured limit.
    int append (chain_t &chain_, const frame_t &frame_);

    void pass_through (const frame_t &frame_, message_t *msg_);
    void complete (chain_t &chain_,
                   uint32_t stream_id_,
                   int last_flags_,
                   message_t *msg_);

    options_t _options;
    chains_t _chains;

    //  Content of the last reassembled message.
    std::vector<unsigned char> _metadata;
    std::vector<unsigned char> _data;

    uint32_t _tag;

    RSFRAME_NON_COPYABLE_NOR_MOVABLE (reassembler_t)
};
}

#endif
