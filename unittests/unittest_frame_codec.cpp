/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/fragmenter.hpp"
#include "protocol/frame.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <limits.h>
#include <vector>

using boost::asio::const_buffer;

void setUp ()
{
}

void tearDown ()
{
}

static std::string to_string (const const_buffer &buf_)
{
    return as_string (buf_.data (), buf_.size ());
}

static void decode (rsframe::frame_t &frame_,
                    const std::vector<unsigned char> &buf_)
{
    TEST_ASSERT_EQUAL_INT (0, frame_.init (&buf_[0], buf_.size ()));
}

void test_payload_with_metadata ()
{
    std::vector<unsigned char> buf;
    const const_buffer metadata ("m", 1);
    const int rc = rsframe::encode_payload (buf, 7, RSFRAME_FLAG_NEXT,
                                            &metadata, const_buffer ("hello", 5));
    TEST_ASSERT_EQUAL_INT (15, rc);

    const unsigned char expected[] = {0x00, 0x00, 0x00, 0x07, 0x29, 0x20,
                                      0x00, 0x00, 0x01, 'm',  'h',  'e',
                                      'l',  'l',  'o'};
    TEST_ASSERT_EQUAL_UINT (sizeof expected, buf.size ());
    TEST_ASSERT_EQUAL_MEMORY (expected, &buf[0], sizeof expected);

    rsframe::frame_t frame;
    decode (frame, buf);
    TEST_ASSERT_EQUAL_UINT32 (7, frame.stream_id ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, frame.type ());
    TEST_ASSERT_TRUE (frame.has_metadata ());
    TEST_ASSERT_FALSE (frame.has_follows ());
    TEST_ASSERT_TRUE (frame.is_next ());

    const_buffer out;
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_STRING ("m", to_string (out).c_str ());
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("hello", to_string (out).c_str ());

    //  Views point into the source buffer.
    TEST_ASSERT_EQUAL_PTR (&buf[10], out.data ());
}

void test_request_stream_max_request_n ()
{
    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (10, rsframe::encode_request_stream (
                                 buf, 1, 2147483647, NULL, const_buffer ()));

    rsframe::frame_t frame;
    decode (frame, buf);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_STREAM, frame.type ());
    TEST_ASSERT_EQUAL_UINT32 (1, frame.stream_id ());
    TEST_ASSERT_FALSE (frame.has_metadata ());

    uint32_t request_n = 0;
    TEST_ASSERT_EQUAL_INT (0, frame.request_n (&request_n));
    TEST_ASSERT_EQUAL_UINT32 (2147483647u, request_n);

    const_buffer data ("x", 1);
    TEST_ASSERT_EQUAL_INT (0, frame.data (&data));
    TEST_ASSERT_EQUAL_UINT (0, data.size ());
}

void test_truncated_header ()
{
    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (6, rsframe::encode_cancel (buf, 3));

    rsframe::frame_t frame;
    for (size_t size = 0; size < rsframe::header_size; size++) {
        TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], size));
        TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
        TEST_ASSERT_FALSE (frame.valid ());
    }
}

void test_roundtrip_request_types ()
{
    const const_buffer metadata ("route", 5);
    const const_buffer data ("body", 4);

    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (
      6 + 3 + 5 + 4,
      rsframe::encode_request_response (buf, 5, &metadata, data));
    const size_t first = buf.size ();
    TEST_ASSERT_EQUAL_INT (
      6 + 4, rsframe::encode_request_fnf (buf, 9, NULL, data,
                                          RSFRAME_FLAG_IGNORE));
    const size_t second = buf.size ();
    TEST_ASSERT_EQUAL_INT (6 + 4 + 3 + 5 + 4,
                           rsframe::encode_request_channel (
                             buf, 11, 16, &metadata, data,
                             RSFRAME_FLAG_COMPLETE));

    rsframe::frame_t frame;
    const_buffer out;
    uint32_t request_n = 0;

    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[0], first));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_RESPONSE, frame.type ());
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_STRING ("route", to_string (out).c_str ());
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("body", to_string (out).c_str ());
    TEST_ASSERT_EQUAL_INT (-1, frame.request_n (&request_n));
    TEST_ASSERT_EQUAL_INT (EREQNNOTSUP, errno);

    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[first], second - first));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_FNF, frame.type ());
    TEST_ASSERT_EQUAL_UINT32 (9, frame.stream_id ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_IGNORE, frame.flags ());
    TEST_ASSERT_FALSE (frame.has_metadata ());
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("body", to_string (out).c_str ());

    TEST_ASSERT_EQUAL_INT (0,
                           frame.init (&buf[second], buf.size () - second));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_CHANNEL, frame.type ());
    TEST_ASSERT_TRUE (frame.is_complete ());
    TEST_ASSERT_EQUAL_INT (0, frame.request_n (&request_n));
    TEST_ASSERT_EQUAL_UINT32 (16, request_n);
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_STRING ("route", to_string (out).c_str ());
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("body", to_string (out).c_str ());
}

void test_roundtrip_control_types ()
{
    std::vector<unsigned char> buf;
    rsframe::frame_t frame;
    uint32_t value = 0;

    TEST_ASSERT_EQUAL_INT (10, rsframe::encode_request_n (buf, 3, 64));
    decode (frame, buf);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_N, frame.type ());
    TEST_ASSERT_EQUAL_INT (0, frame.request_n (&value));
    TEST_ASSERT_EQUAL_UINT32 (64, value);

    buf.clear ();
    TEST_ASSERT_EQUAL_INT (
      6 + 4 + 4, rsframe::encode_error (buf, 3, 0x00000201,
                                        const_buffer ("oops", 4)));
    decode (frame, buf);
    TEST_ASSERT_EQUAL_INT (0, frame.error_code (&value));
    TEST_ASSERT_EQUAL_UINT32 (0x201, value);
    const_buffer out;
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("oops", to_string (out).c_str ());

    buf.clear ();
    TEST_ASSERT_EQUAL_INT (
      6 + 8 + 2, rsframe::encode_keepalive (buf, 0x0102030405060708ull, true,
                                            const_buffer ("ka", 2)));
    decode (frame, buf);
    TEST_ASSERT_EQUAL_UINT32 (0, frame.stream_id ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_RESPOND, frame.flags ());
    uint64_t position = 0;
    TEST_ASSERT_EQUAL_INT (0, frame.last_position (&position));
    TEST_ASSERT_TRUE (position == 0x0102030405060708ull);

    buf.clear ();
    const const_buffer metadata ("lease", 5);
    TEST_ASSERT_EQUAL_INT (6 + 8 + 3 + 5,
                           rsframe::encode_lease (buf, 30000, 100, &metadata));
    decode (frame, buf);
    uint32_t ttl = 0;
    uint32_t requests = 0;
    TEST_ASSERT_EQUAL_INT (0, frame.lease (&ttl, &requests));
    TEST_ASSERT_EQUAL_UINT32 (30000, ttl);
    TEST_ASSERT_EQUAL_UINT32 (100, requests);
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_STRING ("lease", to_string (out).c_str ());

    buf.clear ();
    TEST_ASSERT_EQUAL_INT (6, rsframe::encode_cancel (buf, 3));
    decode (frame, buf);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_CANCEL, frame.type ());
    TEST_ASSERT_EQUAL_INT (-1, frame.error_code (&value));
    TEST_ASSERT_EQUAL_INT (ENOTSUP, errno);
}

void test_metadata_push_uses_length_prefix ()
{
    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (
      6 + 3 + 4, rsframe::encode_metadata_push (buf, const_buffer ("meta", 4)));
    TEST_ASSERT_EQUAL_UINT32 (4, rsframe::get_uint24 (&buf[6]));

    rsframe::frame_t frame;
    decode (frame, buf);
    TEST_ASSERT_TRUE (frame.has_metadata ());
    const_buffer out;
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_STRING ("meta", to_string (out).c_str ());
    TEST_ASSERT_EQUAL_INT (-1, frame.data (&out));
    TEST_ASSERT_EQUAL_INT (EDATANOTSUP, errno);
}

void test_payload_size_law ()
{
    const const_buffer metadata ("abc", 3);
    const const_buffer data ("0123456789", 10);

    std::vector<unsigned char> buf;
    rsframe::encode_request_stream (buf, 1, 5, &metadata, data);
    size_t length = 0;
    TEST_ASSERT_EQUAL_INT (
      0, rsframe::frame_t::data_length (&buf[0], buf.size (), &length));
    TEST_ASSERT_EQUAL_UINT (buf.size () - 6 - 4 - 3 - 3, length);
    TEST_ASSERT_EQUAL_UINT (10, length);

    buf.clear ();
    rsframe::encode_payload (buf, 1, 0, NULL, data);
    TEST_ASSERT_EQUAL_INT (
      0, rsframe::frame_t::data_length (&buf[0], buf.size (), &length));
    TEST_ASSERT_EQUAL_UINT (buf.size () - 6, length);

    buf.clear ();
    rsframe::encode_keepalive (buf, 1, false, data);
    TEST_ASSERT_EQUAL_INT (
      0, rsframe::frame_t::data_length (&buf[0], buf.size (), &length));
    TEST_ASSERT_EQUAL_UINT (10, length);
}

void test_metadata_absence ()
{
    //  An absent block and a present, empty block differ on the wire.
    std::vector<unsigned char> absent;
    std::vector<unsigned char> empty;
    const const_buffer no_metadata;
    rsframe::encode_payload (absent, 1, 0, NULL, const_buffer ("d", 1));
    rsframe::encode_payload (empty, 1, 0, &no_metadata, const_buffer ("d", 1));
    TEST_ASSERT_EQUAL_UINT (absent.size () + 3, empty.size ());

    rsframe::frame_t frame;
    const_buffer out;
    decode (frame, absent);
    TEST_ASSERT_EQUAL_INT (-1, frame.metadata (&out));
    TEST_ASSERT_EQUAL_INT (ENOMETADATA, errno);

    decode (frame, empty);
    TEST_ASSERT_EQUAL_INT (0, frame.metadata (&out));
    TEST_ASSERT_EQUAL_UINT (0, out.size ());
    TEST_ASSERT_EQUAL_INT (0, frame.data (&out));
    TEST_ASSERT_EQUAL_STRING ("d", to_string (out).c_str ());
}

void test_capability_mismatch_on_encode ()
{
    rsframe::frame_fields_t fields;
    rsframe::frame_encoder_t encoder;

    rsframe::init_fields (&fields, RSFRAME_TYPE_METADATA_PUSH, 0);
    fields.data = "x";
    fields.data_size = 1;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EDATANOTSUP, errno);

    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_N, 1);
    fields.has_metadata = 1;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (ENOTSUP, errno);

    rsframe::init_fields (&fields, RSFRAME_TYPE_SETUP, 0);
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (ENOTSUP, errno);

    rsframe::init_fields (&fields, 0x21, 1);
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);

    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 0x80000001);
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.data_size = 3;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_encoder_ignores_caller_metadata_flag ()
{
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_METADATA | RSFRAME_FLAG_NEXT;

    std::vector<unsigned char> buf;
    TEST_ASSERT_EQUAL_INT (6, rsframe::encode_frame (buf, fields));

    rsframe::frame_t frame;
    decode (frame, buf);
    TEST_ASSERT_FALSE (frame.has_metadata ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_NEXT, frame.flags ());
}

void test_encoder_buffer_too_small ()
{
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.data = "hello";
    fields.data_size = 5;

    rsframe::frame_encoder_t encoder;
    TEST_ASSERT_EQUAL_INT (0, encoder.load (fields));
    TEST_ASSERT_EQUAL_UINT (11, encoder.size ());

    unsigned char buf[16];
    TEST_ASSERT_EQUAL_INT (-1, encoder.encode (buf, 10, false));
    TEST_ASSERT_EQUAL_INT (ENOBUFS, errno);
    TEST_ASSERT_EQUAL_INT (-1, encoder.encode (buf, 13, true));
    TEST_ASSERT_EQUAL_INT (ENOBUFS, errno);
    TEST_ASSERT_EQUAL_INT (14, encoder.encode (buf, sizeof buf, true));
    TEST_ASSERT_EQUAL_UINT32 (11, rsframe::get_uint24 (buf));
}

void test_gather_matches_encode ()
{
    const const_buffer metadata ("mm", 2);
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_REQUEST_STREAM, 3);
    fields.request_n = 8;
    fields.has_metadata = 1;
    fields.metadata = metadata.data ();
    fields.metadata_size = metadata.size ();
    fields.data = "payload";
    fields.data_size = 7;

    rsframe::frame_encoder_t encoder;
    TEST_ASSERT_EQUAL_INT (0, encoder.load (fields));

    std::vector<unsigned char> flat;
    const int rc = encoder.encode (flat, true);
    TEST_ASSERT_EQUAL_INT (static_cast<int> (flat.size ()), rc);

    std::vector<const_buffer> buffers;
    TEST_ASSERT_EQUAL_INT (rc, encoder.gather (buffers, true));
    TEST_ASSERT_EQUAL_UINT (3, buffers.size ());
    //  Content is referenced, not copied.
    TEST_ASSERT_EQUAL_PTR (fields.data, buffers[2].data ());

    std::vector<unsigned char> joined;
    for (size_t i = 0; i < buffers.size (); i++) {
        const unsigned char *p =
          static_cast<const unsigned char *> (buffers[i].data ());
        joined.insert (joined.end (), p, p + buffers[i].size ());
    }
    TEST_ASSERT_TRUE (joined == flat);
}

void test_decode_layout_errors ()
{
    rsframe::frame_t frame;
    std::vector<unsigned char> buf;

    //  Request-N count cut short.
    rsframe::encode_request_n (buf, 1, 5);
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], buf.size () - 1));
    TEST_ASSERT_EQUAL_INT (EPAYLOADSIZE, errno);

    //  Trailing bytes on a type without data.
    buf.push_back (0);
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (EPAYLOADSIZE, errno);

    //  Metadata length beyond the end of the frame.
    buf.clear ();
    const const_buffer metadata ("abcd", 4);
    rsframe::encode_payload (buf, 1, 0, &metadata, const_buffer ());
    rsframe::put_uint24 (&buf[6], 5);
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (EPAYLOADSIZE, errno);

    //  Metadata length itself truncated.
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], 8));
    TEST_ASSERT_EQUAL_INT (EPAYLOADSIZE, errno);

    //  METADATA flag on a type that cannot carry metadata.
    buf.clear ();
    rsframe::encode_cancel (buf, 1);
    rsframe::put_uint16 (&buf[4], (RSFRAME_TYPE_CANCEL << 10)
                                    | RSFRAME_FLAG_METADATA);
    buf.resize (buf.size () + 3, 0);
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
}

void test_opaque_body ()
{
    std::vector<unsigned char> buf (6 + 12, 0xAB);
    rsframe::put_uint32 (&buf[0], 0);
    rsframe::put_uint16 (&buf[4], (RSFRAME_TYPE_SETUP << 10)
                                    | RSFRAME_FLAG_METADATA);

    rsframe::frame_t frame;
    decode (frame, buf);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_SETUP, frame.type ());
    TEST_ASSERT_EQUAL_UINT (buf.size (), frame.buffer ().size ());

    const_buffer out;
    TEST_ASSERT_EQUAL_INT (-1, frame.metadata (&out));
    TEST_ASSERT_EQUAL_INT (ENOTSUP, errno);
    TEST_ASSERT_EQUAL_INT (-1, frame.data (&out));
    TEST_ASSERT_EQUAL_INT (EDATANOTSUP, errno);

    size_t length = 0;
    TEST_ASSERT_EQUAL_INT (
      -1, rsframe::frame_t::data_length (&buf[0], buf.size (), &length));
    TEST_ASSERT_EQUAL_INT (EDATANOTSUP, errno);
}

void test_strict_stream_ids ()
{
    std::vector<unsigned char> buf;
    rsframe::encode_payload (buf, 0, 0, NULL, const_buffer ("x", 1));

    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (-1, frame.init (&buf[0], buf.size (), true));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);

    buf.clear ();
    rsframe::encode_error (buf, 0, 0x101, const_buffer ());
    TEST_ASSERT_EQUAL_INT (0, frame.init (&buf[0], buf.size (), true));
}

void test_encoded_size_fits_int ()
{
    //  Sizes only; the encoder does not read the data when loading.
    static const char data[1] = {0};
    rsframe::frame_fields_t fields;
    rsframe::init_fields (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.data = data;

    rsframe::frame_encoder_t encoder;
    fields.data_size = static_cast<size_t> (INT_MAX) + 1;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    //  Header plus length prefix push it past INT_MAX.
    fields.data_size = static_cast<size_t> (INT_MAX) - 8;
    TEST_ASSERT_EQUAL_INT (-1, encoder.load (fields));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    fields.data_size = static_cast<size_t> (INT_MAX) - 9;
    TEST_ASSERT_EQUAL_INT (0, encoder.load (fields));
    TEST_ASSERT_EQUAL_UINT (static_cast<size_t> (INT_MAX) - 3, encoder.size ());

    //  Split into frames, the same data is fine.
    fields.data_size = static_cast<size_t> (INT_MAX) + 1;
    rsframe::fragmenter_t fragmenter;
    TEST_ASSERT_EQUAL_INT (0, fragmenter.init (fields, 65536));
}

void test_empty_frame_accessors ()
{
    const unsigned char short_buf[4] = {0, 0, 0, 1};
    rsframe::frame_t frame;
    TEST_ASSERT_EQUAL_INT (-1, frame.init (short_buf, sizeof short_buf));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);

    TEST_ASSERT_FALSE (frame.valid ());
    TEST_ASSERT_EQUAL_INT (-1, frame.type ());
    TEST_ASSERT_EQUAL_UINT32 (0, frame.stream_id ());
    TEST_ASSERT_EQUAL_INT (0, frame.flags ());

    const_buffer out;
    TEST_ASSERT_EQUAL_INT (-1, frame.metadata (&out));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    TEST_ASSERT_EQUAL_INT (-1, frame.data (&out));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    uint32_t value = 0;
    TEST_ASSERT_EQUAL_INT (-1, frame.request_n (&value));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    TEST_ASSERT_EQUAL_INT (-1, frame.error_code (&value));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    uint64_t position = 0;
    TEST_ASSERT_EQUAL_INT (-1, frame.last_position (&position));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
    uint32_t requests = 0;
    TEST_ASSERT_EQUAL_INT (-1, frame.lease (&value, &requests));
    TEST_ASSERT_EQUAL_INT (EFSM, errno);
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_payload_with_metadata);
    RUN_TEST (test_request_stream_max_request_n);
    RUN_TEST (test_truncated_header);
    RUN_TEST (test_roundtrip_request_types);
    RUN_TEST (test_roundtrip_control_types);
    RUN_TEST (test_metadata_push_uses_length_prefix);
    RUN_TEST (test_payload_size_law);
    RUN_TEST (test_metadata_absence);
    RUN_TEST (test_capability_mismatch_on_encode);
    RUN_TEST (test_encoder_ignores_caller_metadata_flag);
    RUN_TEST (test_encoder_buffer_too_small);
    RUN_TEST (test_gather_matches_encode);
    RUN_TEST (test_decode_layout_errors);
    RUN_TEST (test_opaque_body);
    RUN_TEST (test_strict_stream_ids);
    RUN_TEST (test_encoded_size_fits_int);
    RUN_TEST (test_empty_frame_accessors);

    return UNITY_END ();
}
