/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/frame_header.hpp"
#include "protocol/wire.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_encode_header_layout ()
{
    unsigned char buf[rsframe::header_size];
    const int rc = rsframe::encode_header (
      buf, sizeof buf, 7, RSFRAME_TYPE_PAYLOAD,
      RSFRAME_FLAG_METADATA | RSFRAME_FLAG_NEXT);
    TEST_ASSERT_EQUAL_INT (rsframe::header_size, rc);

    const unsigned char expected[] = {0x00, 0x00, 0x00, 0x07, 0x29, 0x20};
    TEST_ASSERT_EQUAL_MEMORY (expected, buf, sizeof expected);
}

void test_decode_header_fields ()
{
    unsigned char buf[rsframe::header_size];
    rsframe::put_uint32 (buf, 0x7FFFFFFF);
    rsframe::put_uint16 (buf + 4,
                         (RSFRAME_TYPE_REQUEST_CHANNEL << 10)
                           | RSFRAME_FLAG_FOLLOWS | RSFRAME_FLAG_COMPLETE);

    rsframe::frame_header_t header;
    TEST_ASSERT_EQUAL_INT (0, rsframe::decode_header (buf, sizeof buf, &header));
    TEST_ASSERT_EQUAL_UINT32 (0x7FFFFFFF, header.stream_id);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_CHANNEL, header.type ());
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_FOLLOWS | RSFRAME_FLAG_COMPLETE,
                           header.flags);
    TEST_ASSERT_TRUE (header.has_follows ());
    TEST_ASSERT_FALSE (header.has_metadata ());
}

void test_header_roundtrip_every_type ()
{
    const int types[] = {RSFRAME_TYPE_SETUP,
                         RSFRAME_TYPE_LEASE,
                         RSFRAME_TYPE_KEEPALIVE,
                         RSFRAME_TYPE_REQUEST_RESPONSE,
                         RSFRAME_TYPE_REQUEST_FNF,
                         RSFRAME_TYPE_REQUEST_STREAM,
                         RSFRAME_TYPE_REQUEST_CHANNEL,
                         RSFRAME_TYPE_REQUEST_N,
                         RSFRAME_TYPE_CANCEL,
                         RSFRAME_TYPE_PAYLOAD,
                         RSFRAME_TYPE_ERROR,
                         RSFRAME_TYPE_METADATA_PUSH,
                         RSFRAME_TYPE_RESUME,
                         RSFRAME_TYPE_RESUME_OK,
                         RSFRAME_TYPE_EXT};

    for (size_t i = 0; i < sizeof types / sizeof types[0]; i++) {
        unsigned char buf[rsframe::header_size];
        TEST_ASSERT_EQUAL_INT (
          rsframe::header_size,
          rsframe::encode_header (buf, sizeof buf, 3, types[i],
                                  RSFRAME_FLAG_IGNORE));

        rsframe::frame_header_t header;
        TEST_ASSERT_EQUAL_INT (0,
                               rsframe::decode_header (buf, sizeof buf, &header));
        TEST_ASSERT_EQUAL_INT (types[i], header.type ());
        TEST_ASSERT_EQUAL_UINT32 (3, header.stream_id);
        TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_IGNORE, header.flags);
    }
}

void test_decode_short_buffer ()
{
    unsigned char buf[rsframe::header_size];
    TEST_ASSERT_EQUAL_INT (rsframe::header_size,
                           rsframe::encode_header (buf, sizeof buf, 1,
                                                   RSFRAME_TYPE_CANCEL, 0));

    rsframe::frame_header_t header;
    header.stream_id = 42;
    header.info = NULL;
    header.flags = 0x11;
    for (size_t size = 0; size < sizeof buf; size++) {
        TEST_ASSERT_EQUAL_INT (-1, rsframe::decode_header (buf, size, &header));
        TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
    }
    //  Untouched on failure.
    TEST_ASSERT_EQUAL_UINT32 (42, header.stream_id);
    TEST_ASSERT_NULL (header.info);
    TEST_ASSERT_EQUAL_INT (0x11, header.flags);
}

void test_decode_unknown_type ()
{
    unsigned char buf[rsframe::header_size];
    rsframe::put_uint32 (buf, 1);

    rsframe::frame_header_t header;
    rsframe::put_uint16 (buf + 4, 0x00);
    TEST_ASSERT_EQUAL_INT (-1, rsframe::decode_header (buf, sizeof buf, &header));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);

    rsframe::put_uint16 (buf + 4, 0x10 << 10);
    TEST_ASSERT_EQUAL_INT (-1, rsframe::decode_header (buf, sizeof buf, &header));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
}

void test_decode_reserved_stream_bit ()
{
    unsigned char buf[rsframe::header_size];
    rsframe::put_uint32 (buf, 0x80000001);
    rsframe::put_uint16 (buf + 4, RSFRAME_TYPE_CANCEL << 10);

    rsframe::frame_header_t header;
    TEST_ASSERT_EQUAL_INT (-1, rsframe::decode_header (buf, sizeof buf, &header));
    TEST_ASSERT_EQUAL_INT (EMALFORMED, errno);
}

void test_encode_header_errors ()
{
    unsigned char buf[rsframe::header_size];

    TEST_ASSERT_EQUAL_INT (-1, rsframe::encode_header (buf, sizeof buf,
                                                       0x80000000,
                                                       RSFRAME_TYPE_CANCEL, 0));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (-1, rsframe::encode_header (buf, sizeof buf, 1,
                                                       RSFRAME_TYPE_CANCEL,
                                                       0x400));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (-1,
                           rsframe::encode_header (buf, sizeof buf, 1, 0x20, 0));
    TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);

    TEST_ASSERT_EQUAL_INT (-1, rsframe::encode_header (buf, sizeof buf - 1, 1,
                                                       RSFRAME_TYPE_CANCEL, 0));
    TEST_ASSERT_EQUAL_INT (ENOBUFS, errno);
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_encode_header_layout);
    RUN_TEST (test_decode_header_fields);
    RUN_TEST (test_header_roundtrip_every_type);
    RUN_TEST (test_decode_short_buffer);
    RUN_TEST (test_decode_unknown_type);
    RUN_TEST (test_decode_reserved_stream_bit);
    RUN_TEST (test_encode_header_errors);

    return UNITY_END ();
}
