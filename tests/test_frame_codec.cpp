/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

void setUp ()
{
}

void tearDown ()
{
}

void test_version ()
{
    int major, minor, patch;
    rsframe_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (RSFRAME_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (RSFRAME_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (RSFRAME_VERSION_PATCH, patch);
}

void test_strerror ()
{
    TEST_ASSERT_EQUAL_STRING ("Malformed frame", rsframe_strerror (EMALFORMED));
    TEST_ASSERT_EQUAL_STRING ("Incomplete fragment chain",
                              rsframe_strerror (EINCOMPLETE));
    TEST_ASSERT_NOT_NULL (rsframe_strerror (EINVAL));
}

void test_header_api ()
{
    unsigned char buf[RSFRAME_HEADER_SIZE];
    TEST_ASSERT_EQUAL_INT (RSFRAME_HEADER_SIZE,
                           TEST_ASSERT_SUCCESS_ERRNO (rsframe_header_encode (
                             buf, sizeof buf, 4, RSFRAME_TYPE_CANCEL, 0)));

    uint32_t stream_id = 0;
    int type = 0;
    int flags = -1;
    TEST_ASSERT_SUCCESS_ERRNO (
      rsframe_header_decode (buf, sizeof buf, &stream_id, &type, &flags));
    TEST_ASSERT_EQUAL_UINT32 (4, stream_id);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_CANCEL, type);
    TEST_ASSERT_EQUAL_INT (0, flags);

    TEST_ASSERT_FAILURE_ERRNO (
      EMALFORMED, rsframe_header_decode (buf, 5, &stream_id, &type, &flags));
    TEST_ASSERT_EQUAL_UINT32 (4, stream_id);
}

void test_taxonomy_api ()
{
    TEST_ASSERT_EQUAL_INT (
      1, rsframe_type_has_initial_request_n (RSFRAME_TYPE_REQUEST_CHANNEL));
    TEST_ASSERT_EQUAL_INT (0, rsframe_type_can_have_data (RSFRAME_TYPE_LEASE));
    TEST_ASSERT_EQUAL_INT (1,
                           rsframe_type_can_have_metadata (RSFRAME_TYPE_PAYLOAD));
    TEST_ASSERT_EQUAL_INT (0, rsframe_type_is_fragmentable (RSFRAME_TYPE_CANCEL));
    TEST_ASSERT_EQUAL_STRING ("METADATA_PUSH",
                              rsframe_type_name (RSFRAME_TYPE_METADATA_PUSH));

    TEST_ASSERT_FAILURE_ERRNO (EUNKNOWNTYPE, rsframe_type_can_have_data (0x0F));
    TEST_ASSERT_NULL (rsframe_type_name (0x00));
    TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);
}

void test_stream_id_api ()
{
    TEST_ASSERT_EQUAL_INT (1, rsframe_stream_is_connection_level (0));
    TEST_ASSERT_EQUAL_INT (0, rsframe_stream_is_client_initiated (0));
    TEST_ASSERT_EQUAL_INT (1, rsframe_stream_is_client_initiated (1));
    TEST_ASSERT_EQUAL_INT (1, rsframe_stream_is_server_initiated (2));
    TEST_ASSERT_EQUAL_INT (0, rsframe_stream_is_server_initiated (3));
}

void test_payload_scenario ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 7);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.has_metadata = 1;
    fields.metadata = "m";
    fields.metadata_size = 1;
    fields.data = "hello";
    fields.data_size = 5;
    const std::vector<unsigned char> buf = encode_fields (fields);

    rsframe_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_UINT32 (7, rsframe_frame_stream_id (&frame));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, rsframe_frame_type (&frame));
    TEST_ASSERT_EQUAL_INT (1, rsframe_frame_has_metadata (&frame));
    TEST_ASSERT_EQUAL_INT (0, rsframe_frame_has_follows (&frame));
    TEST_ASSERT_EQUAL_UINT (buf.size (), rsframe_frame_size (&frame));

    const void *data;
    size_t size;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_metadata (&frame, &data, &size));
    TEST_ASSERT_EQUAL_BYTES ("m", data, size);
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_data (&frame, &data, &size));
    TEST_ASSERT_EQUAL_BYTES ("hello", data, size);

    uint32_t request_n;
    TEST_ASSERT_FAILURE_ERRNO (EREQNNOTSUP,
                               rsframe_frame_request_n (&frame, &request_n));
}

void test_request_stream_scenario ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_REQUEST_STREAM, 1);
    fields.request_n = 2147483647;
    const std::vector<unsigned char> buf = encode_fields (fields);
    TEST_ASSERT_EQUAL_UINT (10, buf.size ());

    rsframe_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));

    uint32_t request_n = 0;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_request_n (&frame, &request_n));
    TEST_ASSERT_EQUAL_UINT32 (2147483647u, request_n);

    const void *data;
    size_t size = 1;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_data (&frame, &data, &size));
    TEST_ASSERT_EQUAL_UINT (0, size);

    TEST_ASSERT_FAILURE_ERRNO (ENOMETADATA,
                               rsframe_frame_metadata (&frame, &data, &size));
}

void test_truncated_header_scenario ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 7);
    fields.data = "hello";
    fields.data_size = 5;
    const std::vector<unsigned char> buf = encode_fields (fields);

    rsframe_frame_t frame;
    for (size_t size = 0; size < RSFRAME_HEADER_SIZE; size++)
        TEST_ASSERT_FAILURE_ERRNO (EMALFORMED,
                                   rsframe_frame_decode (&frame, &buf[0], size));
}

void test_fixed_fields_api ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_ERROR, 5);
    fields.error_code = 0x00000203;
    fields.data = "rejected";
    fields.data_size = 8;
    std::vector<unsigned char> buf = encode_fields (fields);

    rsframe_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    uint32_t code = 0;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_error_code (&frame, &code));
    TEST_ASSERT_EQUAL_UINT32 (0x203, code);
    uint64_t position;
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP,
                               rsframe_frame_last_position (&frame, &position));

    rsframe_fields_init (&fields, RSFRAME_TYPE_KEEPALIVE, 0);
    fields.flags = RSFRAME_FLAG_RESPOND;
    fields.position = 99;
    buf = encode_fields (fields);
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_last_position (&frame, &position));
    TEST_ASSERT_TRUE (position == 99);
    TEST_ASSERT_EQUAL_INT (RSFRAME_FLAG_RESPOND, rsframe_frame_flags (&frame));
}

void test_data_length_api ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_REQUEST_CHANNEL, 3);
    fields.request_n = 1;
    fields.has_metadata = 1;
    fields.metadata = "abc";
    fields.metadata_size = 3;
    fields.data = "0123456789";
    fields.data_size = 10;
    const std::vector<unsigned char> buf = encode_fields (fields);

    TEST_ASSERT_EQUAL_INT (10, static_cast<int> (rsframe_frame_data_length (
                                 &buf[0], buf.size ())));
    TEST_ASSERT_EQUAL_INT (-1, static_cast<int> (rsframe_frame_data_length (
                                 &buf[0], buf.size () - 11)));
    TEST_ASSERT_EQUAL_INT (EPAYLOADSIZE, errno);
}

void test_encode_api_errors ()
{
    rsframe_fields_t fields;
    unsigned char buf[64];

    rsframe_fields_init (&fields, RSFRAME_TYPE_CANCEL, 1);
    fields.data = "x";
    fields.data_size = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EDATANOTSUP, rsframe_frame_encode (&fields, buf, sizeof buf, 0));

    rsframe_fields_init (&fields, RSFRAME_TYPE_CANCEL, 1);
    TEST_ASSERT_FAILURE_ERRNO (ENOBUFS, rsframe_frame_encode (&fields, buf, 5, 0));
    TEST_ASSERT_EQUAL_INT (9, TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_encode (
                                &fields, buf, sizeof buf, 1)));
    TEST_ASSERT_EQUAL_INT (6, static_cast<int> (
                                rsframe_frame_encoded_size (&fields)));

    rsframe_fields_init (&fields, RSFRAME_TYPE_RESUME, 0);
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP,
                               rsframe_frame_encode (&fields, buf, sizeof buf, 0));

    TEST_ASSERT_FAILURE_ERRNO (EFAULT,
                               rsframe_frame_encode (NULL, buf, sizeof buf, 0));
}

void test_accessors_after_failed_decode ()
{
    const unsigned char short_buf[4] = {0, 0, 0, 1};
    rsframe_frame_t frame;
    TEST_ASSERT_FAILURE_ERRNO (
      EMALFORMED, rsframe_frame_decode (&frame, short_buf, sizeof short_buf));

    TEST_ASSERT_FAILURE_ERRNO (EFSM, rsframe_frame_type (&frame));
    TEST_ASSERT_EQUAL_UINT32 (0, rsframe_frame_stream_id (&frame));
    TEST_ASSERT_EQUAL_INT (0, rsframe_frame_flags (&frame));
    TEST_ASSERT_EQUAL_INT (0, rsframe_frame_has_metadata (&frame));
    TEST_ASSERT_EQUAL_INT (0, rsframe_frame_has_follows (&frame));
    TEST_ASSERT_EQUAL_INT (0, rsframe_frame_is_complete (&frame));
    TEST_ASSERT_EQUAL_UINT (0, rsframe_frame_size (&frame));

    const void *data = NULL;
    size_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFSM,
                               rsframe_frame_metadata (&frame, &data, &size));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, rsframe_frame_data (&frame, &data, &size));
    TEST_ASSERT_FAILURE_ERRNO (EFSM,
                               rsframe_frame_buffer (&frame, &data, &size));
    uint32_t value = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFSM, rsframe_frame_request_n (&frame, &value));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, rsframe_frame_error_code (&frame, &value));
    uint64_t position = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFSM,
                               rsframe_frame_last_position (&frame, &position));
    uint32_t requests = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFSM,
                               rsframe_frame_lease (&frame, &value, &requests));
}

void test_lease_api ()
{
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_LEASE, 0);
    fields.ttl = 30000;
    fields.lease_requests = 5;
    fields.has_metadata = 1;
    fields.metadata = "m";
    fields.metadata_size = 1;
    std::vector<unsigned char> buf = encode_fields (fields);

    rsframe_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    uint32_t ttl = 0;
    uint32_t requests = 0;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_lease (&frame, &ttl, &requests));
    TEST_ASSERT_EQUAL_UINT32 (30000, ttl);
    TEST_ASSERT_EQUAL_UINT32 (5, requests);

    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT | RSFRAME_FLAG_COMPLETE;
    buf = encode_fields (fields);
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    TEST_ASSERT_FAILURE_ERRNO (ENOTSUP,
                               rsframe_frame_lease (&frame, &ttl, &requests));
    TEST_ASSERT_EQUAL_INT (1, rsframe_frame_is_complete (&frame));
    TEST_ASSERT_EQUAL_INT (1, rsframe_frame_is_next (&frame));
}

void test_opaque_frame_buffer ()
{
    std::vector<unsigned char> buf (RSFRAME_HEADER_SIZE + 12, 0x5A);
    TEST_ASSERT_EQUAL_INT (RSFRAME_HEADER_SIZE,
                           TEST_ASSERT_SUCCESS_ERRNO (rsframe_header_encode (
                             &buf[0], buf.size (), 0, RSFRAME_TYPE_SETUP, 0)));

    rsframe_frame_t frame;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_decode (&frame, &buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_SETUP, rsframe_frame_type (&frame));

    const void *data = NULL;
    size_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (EDATANOTSUP,
                               rsframe_frame_data (&frame, &data, &size));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_buffer (&frame, &data, &size));
    TEST_ASSERT_EQUAL_PTR (&buf[0], data);
    TEST_ASSERT_EQUAL_UINT (buf.size (), size);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_version);
    RUN_TEST (test_strerror);
    RUN_TEST (test_header_api);
    RUN_TEST (test_taxonomy_api);
    RUN_TEST (test_stream_id_api);
    RUN_TEST (test_payload_scenario);
    RUN_TEST (test_request_stream_scenario);
    RUN_TEST (test_truncated_header_scenario);
    RUN_TEST (test_fixed_fields_api);
    RUN_TEST (test_data_length_api);
    RUN_TEST (test_encode_api_errors);
    RUN_TEST (test_accessors_after_failed_decode);
    RUN_TEST (test_lease_api);
    RUN_TEST (test_opaque_frame_buffer);
    return UNITY_END ();
}
