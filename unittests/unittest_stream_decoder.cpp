/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/frame_encoder.hpp"
#include "protocol/stream_decoder.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <vector>

using boost::asio::const_buffer;

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<unsigned char> two_frames ()
{
    std::vector<unsigned char> buf;
    rsframe::frame_fields_t fields;

    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = "abc";
    fields.data_size = 3;
    TEST_ASSERT_EQUAL_INT (3 + 6 + 3, rsframe::encode_frame (buf, fields, true));

    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_N, 1);
    fields.request_n = 7;
    TEST_ASSERT_EQUAL_INT (3 + 6 + 4, rsframe::encode_frame (buf, fields, true));
    return buf;
}

void test_decode_two_frames_single_buffer ()
{
    const std::vector<unsigned char> buf = two_frames ();
    rsframe::stream_decoder_t decoder;

    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[0], buf.size (), &consumed));
    TEST_ASSERT_EQUAL_UINT (12, consumed);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, decoder.frame ().type ());
    //  Decoded in place.
    TEST_ASSERT_EQUAL_PTR (&buf[3], decoder.frame ().buffer ().data ());

    size_t consumed2 = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[consumed],
                                              buf.size () - consumed,
                                              &consumed2));
    TEST_ASSERT_EQUAL_UINT (13, consumed2);
    uint32_t request_n = 0;
    TEST_ASSERT_EQUAL_INT (0, decoder.frame ().request_n (&request_n));
    TEST_ASSERT_EQUAL_UINT32 (7, request_n);

    size_t consumed3 = 1;
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (NULL, 0, &consumed3));
    TEST_ASSERT_EQUAL_UINT (0, consumed3);
}

void test_decode_byte_by_byte ()
{
    const std::vector<unsigned char> buf = two_frames ();
    rsframe::stream_decoder_t decoder;

    int frames = 0;
    for (size_t i = 0; i < buf.size (); i++) {
        size_t consumed = 0;
        const int rc = decoder.decode (&buf[i], 1, &consumed);
        TEST_ASSERT_EQUAL_UINT (1, consumed);
        if (rc == 1) {
            frames++;
            //  Collected into the decoder's own buffer.
            const size_t size = decoder.frame ().buffer ().size ();
            TEST_ASSERT_TRUE (decoder.frame ().buffer ().data ()
                              != static_cast<const void *> (&buf[i + 1 - size]));
            if (frames == 1) {
                const_buffer data;
                TEST_ASSERT_EQUAL_INT (0, decoder.frame ().data (&data));
                TEST_ASSERT_EQUAL_STRING (
                  "abc", as_string (data.data (), data.size ()).c_str ());
            }
        } else
            TEST_ASSERT_EQUAL_INT (0, rc);
    }
    TEST_ASSERT_EQUAL_INT (2, frames);
}

void test_decode_split_length_prefix ()
{
    const std::vector<unsigned char> buf = two_frames ();
    rsframe::stream_decoder_t decoder;

    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (&buf[0], 2, &consumed));
    TEST_ASSERT_EQUAL_UINT (2, consumed);

    //  Length completes here and the whole frame follows: zero copy.
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[2], buf.size () - 2,
                                              &consumed));
    TEST_ASSERT_EQUAL_UINT (10, consumed);
    TEST_ASSERT_EQUAL_PTR (&buf[3], decoder.frame ().buffer ().data ());
}

void test_zero_length_fails_until_reset ()
{
    rsframe::stream_decoder_t decoder;
    const unsigned char zero[3] = {0, 0, 0};

    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (zero, sizeof zero, &consumed));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    const std::vector<unsigned char> buf = two_frames ();
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (&buf[0], buf.size (), &consumed));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    TEST_ASSERT_EQUAL_UINT (0, consumed);

    decoder.reset ();
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[0], buf.size (), &consumed));
}

void test_frame_too_large ()
{
    rsframe::stream_decoder_t decoder;
    const int max = 8;
    TEST_ASSERT_EQUAL_INT (
      0, decoder.setopt (RSFRAME_MAX_FRAME_SIZE, &max, sizeof max));

    unsigned char header[3];
    rsframe::put_uint24 (header, 9);
    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (header, sizeof header, &consumed));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
}

void test_undecodable_frame ()
{
    unsigned char buf[3 + 6];
    rsframe::put_uint24 (buf, 6);
    rsframe::put_uint32 (buf + 3, 1);
    rsframe::put_uint16 (buf + 7, 0x30 << 10);

    rsframe::stream_decoder_t decoder;
    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (buf, sizeof buf, &consumed));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
    TEST_ASSERT_FALSE (decoder.frame ().valid ());
}

void test_strict_stream_ids ()
{
    std::vector<unsigned char> buf;
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_KEEPALIVE, 3);
    TEST_ASSERT_GREATER_THAN_INT (0, rsframe::encode_frame (buf, fields, true));

    rsframe::options_t options;
    options.strict_stream_ids = true;
    rsframe::stream_decoder_t strict (options);
    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (-1, strict.decode (&buf[0], buf.size (), &consumed));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);

    rsframe::stream_decoder_t relaxed;
    TEST_ASSERT_EQUAL_INT (1, relaxed.decode (&buf[0], buf.size (), &consumed));
}

void test_options ()
{
    rsframe::options_t options;
    int value = 0;
    size_t size = sizeof value;

    TEST_ASSERT_EQUAL_INT (0,
                           options.getopt (RSFRAME_MAX_FRAME_SIZE, &value, &size));
    TEST_ASSERT_EQUAL_INT (0xFFFFFF, value);
    TEST_ASSERT_EQUAL_INT (
      0, options.getopt (RSFRAME_INTERLEAVE_FRAGMENTS, &value, &size));
    TEST_ASSERT_EQUAL_INT (1, value);
    TEST_ASSERT_EQUAL_INT (0,
                           options.getopt (RSFRAME_STRICT_STREAM_IDS, &value, &size));
    TEST_ASSERT_EQUAL_INT (0, value);

    int64_t limit = 0;
    size = sizeof limit;
    TEST_ASSERT_EQUAL_INT (
      0, options.getopt (RSFRAME_MAX_REASSEMBLY_SIZE, &limit, &size));
    TEST_ASSERT_TRUE (limit == -1);

    //  Wrong value size, out of range values and unknown ids.
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (RSFRAME_MAX_REASSEMBLY_SIZE, &value, sizeof value));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    value = 2;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (RSFRAME_STRICT_STREAM_IDS, &value, sizeof value));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    value = 0x1000000;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (RSFRAME_MAX_FRAME_SIZE, &value, sizeof value));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    value = 1;
    TEST_ASSERT_EQUAL_INT (-1, options.setopt (99, &value, sizeof value));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_decode_two_frames_single_buffer);
    RUN_TEST (test_decode_byte_by_byte);
    RUN_TEST (test_decode_split_length_prefix);
    RUN_TEST (test_zero_length_fails_until_reset);
    RUN_TEST (test_frame_too_large);
    RUN_TEST (test_undecodable_frame);
    RUN_TEST (test_strict_stream_ids);
    RUN_TEST (test_options);

    return UNITY_END ();
}
