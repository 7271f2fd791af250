/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/fragmenter.hpp"
#include "protocol/frame.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/reassembler.hpp"

#include <unity.h>
#include <vector>

using boost::asio::const_buffer;

typedef std::vector<std::vector<unsigned char> > frames_t;

void setUp ()
{
}

void tearDown ()
{
}

static std::string pattern (size_t size_, char base_)
{
    std::string s;
    for (size_t i = 0; i < size_; i++)
        s += static_cast<char> (base_ + i % 26);
    return s;
}

static frames_t split (const rsframe::frame_fields_t &fields_, size_t max_)
{
    rsframe::fragmenter_t fragmenter;
    TEST_ASSERT_EQUAL_INT (0, fragmenter.init (fields_, max_));

    frames_t frames;
    while (!fragmenter.done ()) {
        std::vector<unsigned char> frame;
        const int rc = fragmenter.next (frame, false);
        TEST_ASSERT_GREATER_THAN_INT (0, rc);
        TEST_ASSERT_EQUAL_UINT (frame.size (), static_cast<size_t> (rc));
        TEST_ASSERT_LESS_OR_EQUAL_UINT (max_, frame.size ());
        frames.push_back (frame);
    }
    std::vector<unsigned char> tail;
    TEST_ASSERT_EQUAL_INT (0, fragmenter.next (tail, false));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (frames.size ()),
                           fragmenter.count ());
    return frames;
}

//  Feeds frames_ to reassembler_ and expects exactly the last one to
//  complete a message.
static void reassemble (rsframe::reassembler_t &reassembler_,
                        const frames_t &frames_,
                        rsframe::message_t *msg_)
{
    rsframe::frame_t frame;
    for (size_t i = 0; i < frames_.size (); i++) {
        TEST_ASSERT_EQUAL_INT (0,
                               frame.init (&frames_[i][0], frames_[i].size ()));
        const int expected = i + 1 == frames_.size () ? 1 : 0;
        TEST_ASSERT_EQUAL_INT (expected, reassembler_.push (frame, msg_));
    }
}

static std::string to_string (const const_buffer &buf_)
{
    return as_string (buf_.data (), buf_.size ());
}

void test_empty_payload_is_not_split ()
{
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_COMPLETE;

    const frames_t frames = split (fields, 16);
    TEST_ASSERT_EQUAL_UINT (1, frames.size ());

    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&frames[0][0], frames[0].size ()));
    TEST_ASSERT_FALSE (frame.has_follows ());
    TEST_ASSERT_TRUE (frame.is_complete ());
}

void test_exact_fit_is_not_split ()
{
    const size_t max = 32;
    const std::string data = pattern (max - rsframe::header_size, 'a');

    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = data.data ();
    fields.data_size = data.size ();

    const frames_t frames = split (fields, max);
    TEST_ASSERT_EQUAL_UINT (1, frames.size ());
    TEST_ASSERT_EQUAL_UINT (max, frames[0].size ());
}

void test_one_byte_over_splits_in_two ()
{
    const size_t max = 32;
    const std::string data = pattern (max - rsframe::header_size + 1, 'a');

    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT | RSFRAME_FLAG_COMPLETE;
    fields.data = data.data ();
    fields.data_size = data.size ();

    const frames_t frames = split (fields, max);
    TEST_ASSERT_EQUAL_UINT (2, frames.size ());

    rsframe::frame_t first;
    rsframe::frame_t last;
    TEST_ASSERT_EQUAL_INT (0, first.init (&frames[0][0], frames[0].size ()));
    TEST_ASSERT_EQUAL_INT (0, last.init (&frames[1][0], frames[1].size ()));
    TEST_ASSERT_TRUE (first.has_follows ());
    TEST_ASSERT_FALSE (first.is_complete ());
    TEST_ASSERT_FALSE (last.has_follows ());
    TEST_ASSERT_TRUE (last.is_complete ());
    TEST_ASSERT_TRUE (last.is_next ());

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    reassemble (reassembler, frames, &msg);
    TEST_ASSERT_EQUAL_INT (2, msg.fragments);
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_NEXT | RSFRAME_FLAG_COMPLETE,
                           msg.flags);
    TEST_ASSERT_EQUAL_STRING (data.c_str (), to_string (msg.data).c_str ());
}

void test_large_request_stream ()
{
    const std::string metadata = pattern (100, 'A');
    const std::string data = pattern (1000, 'a');

    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_STREAM, 5);
    fields.request_n = 12;
    fields.has_metadata = 1;
    fields.metadata = metadata.data ();
    fields.metadata_size = metadata.size ();
    fields.data = data.data ();
    fields.data_size = data.size ();

    const frames_t frames = split (fields, 64);
    TEST_ASSERT_GREATER_THAN_UINT (17, frames.size ());

    rsframe::frame_t frame;
    for (size_t i = 0; i < frames.size (); i++) {
        TEST_ASSERT_EQUAL_INT (0,
                               frame.init (&frames[i][0], frames[i].size ()));
        TEST_ASSERT_EQUAL_UINT32 (5, frame.stream_id ());
        TEST_ASSERT_EQUAL_INT (i == 0 ? RSFRAME_TYPE_REQUEST_STREAM
                                      : RSFRAME_TYPE_PAYLOAD,
                               frame.type ());
        TEST_ASSERT_EQUAL (i + 1 < frames.size (), frame.has_follows ());
        if (i > 0)
            TEST_ASSERT_TRUE (frame.is_next ());
    }

    //  The first frame is filled with metadata only.
    TEST_ASSERT_EQUAL_INT (0, frame.init (&frames[0][0], frames[0].size ()));
    TEST_ASSERT_EQUAL_UINT (64, frames[0].size ());
    uint32_t request_n = 0;
    TEST_ASSERT_EQUAL_INT (0, frame.request_n (&request_n));
    TEST_ASSERT_EQUAL_UINT32 (12, request_n);
    const_buffer slice;
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&slice));
    TEST_ASSERT_EQUAL_UINT (64 - 6 - 4 - 3, slice.size ());

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    reassemble (reassembler, frames, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_STREAM, msg.info->type);
    TEST_ASSERT_EQUAL_UINT32 (5, msg.stream_id);
    TEST_ASSERT_TRUE (msg.has_request_n);
    TEST_ASSERT_EQUAL_UINT32 (12, msg.request_n);
    TEST_ASSERT_TRUE (msg.has_metadata);
    TEST_ASSERT_EQUAL_INT (static_cast<int> (frames.size ()), msg.fragments);
    TEST_ASSERT_EQUAL_STRING (metadata.c_str (),
                              to_string (msg.metadata).c_str ());
    TEST_ASSERT_EQUAL_STRING (data.c_str (), to_string (msg.data).c_str ());
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());
}

void test_empty_metadata_survives_split ()
{
    const std::string data = pattern (40, 'a');

    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_RESPONSE, 1);
    fields.has_metadata = 1;
    fields.data = data.data ();
    fields.data_size = data.size ();

    const frames_t frames = split (fields, 16);

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    reassemble (reassembler, frames, &msg);
    TEST_ASSERT_TRUE (msg.has_metadata);
    TEST_ASSERT_EQUAL_UINT (0, msg.metadata.size ());
    TEST_ASSERT_EQUAL_STRING (data.c_str (), to_string (msg.data).c_str ());
}

void test_split_errors ()
{
    const std::string data = pattern (100, 'a');
    rsframe::frame_fields_t fields;
    rsframe::fragmenter_t fragmenter;

    rsframe::init_fields (&fields, RSFRAME_TYPE_ERROR, 1);
    fields.error_code = 0x201;
    fields.data = data.data ();
    fields.data_size = data.size ();
    TEST_ASSERT_EQUAL_INT (-1, fragmenter.init (fields, 64));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_STREAM, 1);
    fields.data = data.data ();
    fields.data_size = data.size ();
    TEST_ASSERT_EQUAL_INT (-1, fragmenter.init (fields, 13));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (0, fragmenter.init (fields, 14));

    TEST_ASSERT_EQUAL_INT (-1, fragmenter.init (fields, 0));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    //  A short buffer does not lose the fragment.
    TEST_ASSERT_EQUAL_INT (0, fragmenter.init (fields, 32));
    unsigned char buf[32];
    TEST_ASSERT_EQUAL_INT (-1, fragmenter.next (buf, 8, false));
    TEST_ASSERT_EQUAL_INT (ENOBUFS, errno);
    TEST_ASSERT_EQUAL_INT (32, fragmenter.next (buf, sizeof buf, false));
}

static void push_encoded (rsframe::reassembler_t &reassembler_,
                          const std::vector<unsigned char> &buf_,
                          int expected_,
                          rsframe::message_t *msg_)
{
    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf_[0], buf_.size ()));
    TEST_ASSERT_EQUAL_INT (expected_, reassembler_.push (frame, msg_));
}

static frames_t split_payload (uint32_t stream_id_, const std::string &data_)
{
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, stream_id_);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = data_.data ();
    fields.data_size = data_.size ();
    return split (fields, 16);
}

void test_interleaved_streams ()
{
    const std::string one = pattern (30, 'a');
    const std::string two = pattern (30, 'A');
    const frames_t a = split_payload (1, one);
    const frames_t b = split_payload (3, two);
    TEST_ASSERT_EQUAL_UINT (3, a.size ());
    TEST_ASSERT_EQUAL_UINT (3, b.size ());

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);
    push_encoded (reassembler, b[0], 0, &msg);
    push_encoded (reassembler, a[1], 0, &msg);
    push_encoded (reassembler, b[1], 0, &msg);
    TEST_ASSERT_EQUAL_UINT (2, reassembler.pending ());

    push_encoded (reassembler, b[2], 1, &msg);
    TEST_ASSERT_EQUAL_UINT32 (3, msg.stream_id);
    TEST_ASSERT_EQUAL_STRING (two.c_str (), to_string (msg.data).c_str ());

    push_encoded (reassembler, a[2], 1, &msg);
    TEST_ASSERT_EQUAL_UINT32 (1, msg.stream_id);
    TEST_ASSERT_EQUAL_STRING (one.c_str (), to_string (msg.data).c_str ());
}

void test_interleaving_rejected ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));
    const frames_t b = split_payload (3, pattern (30, 'A'));

    rsframe::reassembler_t reassembler;
    const int off = 0;
    TEST_ASSERT_EQUAL_INT (0, reassembler.setopt (RSFRAME_INTERLEAVE_FRAGMENTS,
                                                  &off, sizeof off));

    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);

    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&b[0][0], b[0].size ()));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (frame, &msg));
    TEST_ASSERT_EQUAL_INT (EINTERLEAVED, errno);

    //  Connection-level frames are not part of any chain.
    std::vector<unsigned char> keepalive;
    rsframe::encode_keepalive (keepalive, 0, true, const_buffer ());
    push_encoded (reassembler, keepalive, 1, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_KEEPALIVE, msg.info->type);

    push_encoded (reassembler, a[1], 0, &msg);
    push_encoded (reassembler, a[2], 1, &msg);
    TEST_ASSERT_EQUAL_UINT32 (1, msg.stream_id);
}

void test_control_frames_pass_while_chain_open ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));
    const frames_t b = split_payload (3, pattern (30, 'A'));

    rsframe::reassembler_t reassembler;
    const int off = 0;
    TEST_ASSERT_EQUAL_INT (0, reassembler.setopt (RSFRAME_INTERLEAVE_FRAGMENTS,
                                                  &off, sizeof off));

    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);

    std::vector<unsigned char> request_n;
    TEST_ASSERT_GREATER_THAN_INT (0,
                                  rsframe::encode_request_n (request_n, 3, 10));
    push_encoded (reassembler, request_n, 1, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_N, msg.info->type);
    TEST_ASSERT_EQUAL_UINT32 (3, msg.stream_id);
    TEST_ASSERT_EQUAL_UINT32 (10, msg.request_n);

    std::vector<unsigned char> cancel;
    TEST_ASSERT_GREATER_THAN_INT (0, rsframe::encode_cancel (cancel, 5));
    push_encoded (reassembler, cancel, 1, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_CANCEL, msg.info->type);
    TEST_ASSERT_EQUAL_UINT32 (5, msg.stream_id);

    std::vector<unsigned char> payload;
    TEST_ASSERT_GREATER_THAN_INT (
      0, rsframe::encode_payload (payload, 3, RSFRAME_FLAG_NEXT, NULL,
                                  const_buffer ("hi", 2)));
    push_encoded (reassembler, payload, 1, &msg);
    TEST_ASSERT_EQUAL_STRING ("hi", to_string (msg.data).c_str ());

    //  The stream 1 chain is still the only one.
    TEST_ASSERT_EQUAL_UINT (1, reassembler.pending ());
    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&b[0][0], b[0].size ()));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (frame, &msg));
    TEST_ASSERT_EQUAL_INT (EINTERLEAVED, errno);

    push_encoded (reassembler, a[1], 0, &msg);
    push_encoded (reassembler, a[2], 1, &msg);
    TEST_ASSERT_EQUAL_UINT32 (1, msg.stream_id);

    //  Once stream 1 is done another chain may open.
    push_encoded (reassembler, b[0], 0, &msg);
    TEST_ASSERT_EQUAL_UINT (1, reassembler.pending ());
}

void test_metadata_beyond_frame_length_limit ()
{
    //  One byte more than a single metadata length can describe.
    std::string metadata (RSFRAME_MAX_METADATA_SIZE + 1, 'm');
    metadata[0] = 'a';
    metadata[metadata.size () - 1] = 'z';
    const std::string data = "tail";

    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT | RSFRAME_FLAG_COMPLETE;
    fields.has_metadata = 1;
    fields.metadata = metadata.data ();
    fields.metadata_size = metadata.size ();
    fields.data = data.data ();
    fields.data_size = data.size ();

    //  Too large for a single frame.
    rsframe::frame_encoder_t encoder;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    const frames_t frames = split (fields, 65536);
    TEST_ASSERT_GREATER_THAN_UINT (256, frames.size ());

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    reassemble (reassembler, frames, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, msg.info->type);
    TEST_ASSERT_TRUE (msg.has_metadata);
    TEST_ASSERT_EQUAL_UINT (metadata.size (), msg.metadata.size ());
    TEST_ASSERT_TRUE (to_string (msg.metadata) == metadata);
    TEST_ASSERT_EQUAL_STRING (data.c_str (), to_string (msg.data).c_str ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_METADATA | RSFRAME_FLAG_NEXT
                             | RSFRAME_FLAG_COMPLETE,
                           msg.flags);

    //  Types that cannot be split still fail.
    rsframe::init_fields (&fields, RSFRAME_TYPE_METADATA_PUSH, 0);
    fields.has_metadata = 1;
    fields.metadata = metadata.data ();
    fields.metadata_size = metadata.size ();
    rsframe::fragmenter_t fragmenter;
    TEST_ASSERT_EQUAL_INT (-1, fragmenter.init (fields, 65536));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
}

void test_cancel_discards_chain ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);

    std::vector<unsigned char> cancel;
    rsframe::encode_cancel (cancel, 1);
    push_encoded (reassembler, cancel, 1, &msg);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_CANCEL, msg.info->type);
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());

    push_encoded (reassembler, a[0], 0, &msg);
    std::vector<unsigned char> error;
    rsframe::encode_error (error, 1, 0x201, const_buffer ("bad", 3));
    push_encoded (reassembler, error, 1, &msg);
    TEST_ASSERT_EQUAL_STRING ("bad", to_string (msg.data).c_str ());
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());

    push_encoded (reassembler, a[0], 0, &msg);
    reassembler.cancel (1);
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());
    TEST_ASSERT_EQUAL_INT (0, reassembler.finish ());
}

void test_finish_with_open_chain ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);
    push_encoded (reassembler, a[1], 0, &msg);

    TEST_ASSERT_EQUAL_INT (-1, reassembler.finish ());
    TEST_ASSERT_EQUAL_INT (EINCOMPLETE, errno);
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());
}

void test_malformed_chains ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));
    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    rsframe::frame_t frame;

    //  Only PAYLOAD may continue a chain.
    push_encoded (reassembler, a[0], 0, &msg);
    std::vector<unsigned char> request;
    rsframe::encode_request_response (request, 1, NULL, const_buffer ("x", 1));
    TEST_ASSERT_EQUAL_INT (0, frame.init (&request[0], request.size ()));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (frame, &msg));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());

    //  FOLLOWS on a type that cannot be fragmented.
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_N, 1);
    fields.flags = RSFRAME_FLAG_FOLLOWS;
    fields.request_n = 1;
    std::vector<unsigned char> request_n;
    rsframe::encode_frame (request_n, fields);
    TEST_ASSERT_EQUAL_INT (0, frame.init (&request_n[0], request_n.size ()));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (frame, &msg));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
}

void test_reassembly_limit ()
{
    const frames_t a = split_payload (1, pattern (30, 'a'));

    rsframe::reassembler_t reassembler;
    const int64_t limit = 15;
    TEST_ASSERT_EQUAL_INT (0, reassembler.setopt (RSFRAME_MAX_REASSEMBLY_SIZE,
                                                  &limit, sizeof limit));

    rsframe::message_t msg;
    push_encoded (reassembler, a[0], 0, &msg);

    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&a[1][0], a[1].size ()));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (frame, &msg));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
    TEST_ASSERT_EQUAL_UINT (0, reassembler.pending ());
}

void test_single_frame_passes_through ()
{
    std::vector<unsigned char> buf;
    const const_buffer metadata ("m", 1);
    rsframe::encode_payload (buf, 7, RSFRAME_FLAG_NEXT, &metadata,
                             const_buffer ("hello", 5));

    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    push_encoded (reassembler, buf, 1, &msg);
    TEST_ASSERT_EQUAL_INT (1, msg.fragments);
    TEST_ASSERT_TRUE (msg.has_metadata);
    TEST_ASSERT_TRUE (msg.has_data);
    TEST_ASSERT_FALSE (msg.has_request_n);
    //  Views into the frame buffer.
    TEST_ASSERT_EQUAL_PTR (&buf[10], msg.data.data ());
    TEST_ASSERT_EQUAL_STRING ("m", to_string (msg.metadata).c_str ());
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_empty_payload_is_not_split);
    RUN_TEST (test_exact_fit_is_not_split);
    RUN_TEST (test_one_byte_over_splits_in_two);
    RUN_TEST (test_large_request_stream);
    RUN_TEST (test_empty_metadata_survives_split);
    RUN_TEST (test_split_errors);
    RUN_TEST (test_interleaved_streams);
    RUN_TEST (test_interleaving_rejected);
    RUN_TEST (test_control_frames_pass_while_chain_open);
    RUN_TEST (test_metadata_beyond_frame_length_limit);
    RUN_TEST (test_cancel_discards_chain);
    RUN_TEST (test_finish_with_open_chain);
    RUN_TEST (test_malformed_chains);
    RUN_TEST (test_reassembly_limit);
    RUN_TEST (test_single_frame_passes_through);

    return UNITY_END ();
}
