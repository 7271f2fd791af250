/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/fragmenter.hpp"
#include "protocol/frame.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/reassembler.hpp"
#include "protocol/stream_decoder.hpp"
#include "utils/debug_counters.h"

#include <unity.h>
#include <vector>

using boost::asio::const_buffer;

void setUp ()
{
    rsframe_debug_reset_counters ();
}

void tearDown ()
{
}

void test_decode_counters ()
{
#if defined RSFRAME_DEBUG_COUNTERS
    std::vector<unsigned char> buf;
    TEST_ASSERT_GREATER_THAN_INT (
      0, rsframe::encode_payload (buf, 1, RSFRAME_FLAG_NEXT, NULL,
                                  const_buffer ("abc", 3)));

    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], 4));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);

    TEST_ASSERT_EQUAL_UINT (1, rsframe_debug_get_decoded_count ());
    TEST_ASSERT_EQUAL_UINT (1, rsframe_debug_get_decode_error_count ());
#else
    TEST_IGNORE_MESSAGE ("Debug counters not enabled, skipping decode "
                         "counter test");
#endif
}

void test_reassembly_counters ()
{
#if defined RSFRAME_DEBUG_COUNTERS
    const std::string data (40, 'x');
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = data.data ();
    fields.data_size = data.size ();

    //  16-byte frames hold 10 bytes of data each.
    rsframe::fragmenter_t fragmenter;
    TEST_ASSERT_EQUAL_INT (0, fragmenter.init (fields, 16));
    rsframe::reassembler_t reassembler;
    rsframe::message_t msg;
    rsframe::frame_t frame;
    int rc = 0;
    while (!fragmenter.done ()) {
        std::vector<unsigned char> buf;
        TEST_ASSERT_GREATER_THAN_INT (0, fragmenter.next (buf, false));
        TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[0], buf.size ()));
        rc = reassembler.push (frame, &msg);
        TEST_ASSERT_NOT_EQUAL (-1, rc);
    }
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_INT (4, msg.fragments);

    TEST_ASSERT_EQUAL_UINT (4, rsframe_debug_get_decoded_count ());
    TEST_ASSERT_EQUAL_UINT (0, rsframe_debug_get_decode_error_count ());
    TEST_ASSERT_EQUAL_UINT (3, rsframe_debug_get_fragment_count ());
    TEST_ASSERT_EQUAL_UINT (1, rsframe_debug_get_reassembled_count ());
#else
    TEST_IGNORE_MESSAGE ("Debug counters not enabled, skipping reassembly "
                         "counter test");
#endif
}

void test_stream_copy_counter ()
{
#if defined RSFRAME_DEBUG_COUNTERS
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_CANCEL, 3);
    std::vector<unsigned char> stream;
    TEST_ASSERT_GREATER_THAN_INT (0,
                                  rsframe::encode_frame (stream, fields, true));
    const size_t first_size = stream.size ();
    fields.type = RSFRAME_TYPE_PAYLOAD;
    fields.stream_id = 1;
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = "hello";
    fields.data_size = 5;
    TEST_ASSERT_GREATER_THAN_INT (0,
                                  rsframe::encode_frame (stream, fields, true));

    rsframe::stream_decoder_t decoder;
    size_t consumed = 0;

    //  The first frame is whole in the input and decoded in place.
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&stream[0], first_size + 4,
                                              &consumed));
    TEST_ASSERT_EQUAL_UINT (first_size, consumed);
    TEST_ASSERT_EQUAL_UINT (0, rsframe_debug_get_stream_copy_count ());

    //  The second one is split across two reads and gets copied.
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (&stream[first_size], 4,
                                              &consumed));
    TEST_ASSERT_EQUAL_UINT (4, consumed);
    TEST_ASSERT_EQUAL_INT (
      1, decoder.decode (&stream[first_size + 4],
                         stream.size () - first_size - 4, &consumed));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, decoder.frame ().type ());
    TEST_ASSERT_EQUAL_UINT (1, rsframe_debug_get_stream_copy_count ());
    TEST_ASSERT_EQUAL_UINT (2, rsframe_debug_get_decoded_count ());
#else
    TEST_IGNORE_MESSAGE ("Debug counters not enabled, skipping stream "
                         "counter test");
#endif
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_decode_counters);
    RUN_TEST (test_reassembly_counters);
    RUN_TEST (test_stream_copy_counter);

    return UNITY_END ();
}
