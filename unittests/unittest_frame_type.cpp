/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/frame_type.hpp"
#include "protocol/stream_id.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_request_types ()
{
    const rsframe::frame_type_info_t *info =
      rsframe::find_frame_type (RSFRAME_TYPE_REQUEST_STREAM);
    TEST_ASSERT_NOT_NULL (info);
    TEST_ASSERT_EQUAL_STRING ("REQUEST_STREAM", info->name);
    TEST_ASSERT_TRUE (info->has_initial_request_n ());
    TEST_ASSERT_TRUE (info->can_have_data ());
    TEST_ASSERT_TRUE (info->can_have_metadata ());
    TEST_ASSERT_TRUE (info->is_fragmentable ());
    TEST_ASSERT_EQUAL_UINT (4, info->prefix_size ());

    info = rsframe::find_frame_type (RSFRAME_TYPE_REQUEST_CHANNEL);
    TEST_ASSERT_TRUE (info->has_initial_request_n ());

    info = rsframe::find_frame_type (RSFRAME_TYPE_REQUEST_RESPONSE);
    TEST_ASSERT_FALSE (info->has_initial_request_n ());
    TEST_ASSERT_TRUE (info->can_have_data ());
    TEST_ASSERT_EQUAL_UINT (0, info->prefix_size ());
}

void test_payload_and_control_types ()
{
    const rsframe::frame_type_info_t *payload =
      rsframe::find_frame_type (RSFRAME_TYPE_PAYLOAD);
    TEST_ASSERT_TRUE (payload->can_have_data ());
    TEST_ASSERT_TRUE (payload->can_have_metadata ());
    TEST_ASSERT_FALSE (payload->has_initial_request_n ());

    const rsframe::frame_type_info_t *push =
      rsframe::find_frame_type (RSFRAME_TYPE_METADATA_PUSH);
    TEST_ASSERT_FALSE (push->can_have_data ());
    TEST_ASSERT_TRUE (push->can_have_metadata ());
    TEST_ASSERT_FALSE (push->is_fragmentable ());

    const rsframe::frame_type_info_t *request_n =
      rsframe::find_frame_type (RSFRAME_TYPE_REQUEST_N);
    TEST_ASSERT_FALSE (request_n->can_have_data ());
    TEST_ASSERT_FALSE (request_n->can_have_metadata ());
    TEST_ASSERT_EQUAL_INT (rsframe::fixed_request_n, request_n->fixed);
    TEST_ASSERT_EQUAL_UINT (4, request_n->fixed_size);

    const rsframe::frame_type_info_t *keepalive =
      rsframe::find_frame_type (RSFRAME_TYPE_KEEPALIVE);
    TEST_ASSERT_TRUE (keepalive->can_have_data ());
    TEST_ASSERT_EQUAL_UINT (8, keepalive->prefix_size ());

    const rsframe::frame_type_info_t *setup =
      rsframe::find_frame_type (RSFRAME_TYPE_SETUP);
    TEST_ASSERT_TRUE (setup->is_opaque ());
    TEST_ASSERT_FALSE (setup->can_have_data ());

    TEST_ASSERT_NOT_NULL (rsframe::find_frame_type (RSFRAME_TYPE_EXT));
}

void test_unknown_type ()
{
    const int codes[] = {0x00, 0x0F, 0x20, 0x3E, 0x40, -1};
    for (size_t i = 0; i < sizeof codes / sizeof codes[0]; i++) {
        TEST_ASSERT_NULL (rsframe::find_frame_type (codes[i]));
        TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);
    }

    TEST_ASSERT_EQUAL_INT (-1, rsframe::has_initial_request_n (0x0F));
    TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);
    TEST_ASSERT_EQUAL_INT (-1, rsframe::can_have_data (0x0F));
    TEST_ASSERT_EQUAL_INT (EUNKNOWNTYPE, errno);
}

void test_raw_code_queries ()
{
    TEST_ASSERT_EQUAL_INT (1,
                           rsframe::has_initial_request_n (RSFRAME_TYPE_REQUEST_STREAM));
    TEST_ASSERT_EQUAL_INT (0, rsframe::has_initial_request_n (RSFRAME_TYPE_PAYLOAD));
    TEST_ASSERT_EQUAL_INT (1, rsframe::can_have_data (RSFRAME_TYPE_ERROR));
    TEST_ASSERT_EQUAL_INT (0, rsframe::can_have_data (RSFRAME_TYPE_CANCEL));
    TEST_ASSERT_EQUAL_INT (1, rsframe::can_have_metadata (RSFRAME_TYPE_LEASE));
    TEST_ASSERT_EQUAL_INT (0, rsframe::is_fragmentable (RSFRAME_TYPE_ERROR));
}

void test_stream_id_classification ()
{
    const uint32_t ids[] = {0, 1, 2, 3, 4, 7, 1000, 0x7FFFFFFE, 0x7FFFFFFF};
    for (size_t i = 0; i < sizeof ids / sizeof ids[0]; i++) {
        const int holds = (rsframe::is_connection_level (ids[i]) ? 1 : 0)
                          + (rsframe::is_client_initiated (ids[i]) ? 1 : 0)
                          + (rsframe::is_server_initiated (ids[i]) ? 1 : 0);
        TEST_ASSERT_EQUAL_INT (1, holds);
        TEST_ASSERT_TRUE (rsframe::stream_id_valid (ids[i]));
    }

    TEST_ASSERT_TRUE (rsframe::is_connection_level (0));
    TEST_ASSERT_TRUE (rsframe::is_client_initiated (7));
    TEST_ASSERT_TRUE (rsframe::is_server_initiated (2));
    TEST_ASSERT_FALSE (rsframe::stream_id_valid (0x80000000));
}

void test_stream_scope ()
{
    const rsframe::frame_type_info_t &keepalive =
      *rsframe::find_frame_type (RSFRAME_TYPE_KEEPALIVE);
    const rsframe::frame_type_info_t &payload =
      *rsframe::find_frame_type (RSFRAME_TYPE_PAYLOAD);
    const rsframe::frame_type_info_t &error =
      *rsframe::find_frame_type (RSFRAME_TYPE_ERROR);

    TEST_ASSERT_TRUE (rsframe::stream_scope_matches (keepalive, 0));
    TEST_ASSERT_FALSE (rsframe::stream_scope_matches (keepalive, 1));
    TEST_ASSERT_TRUE (rsframe::stream_scope_matches (payload, 2));
    TEST_ASSERT_FALSE (rsframe::stream_scope_matches (payload, 0));
    TEST_ASSERT_TRUE (rsframe::stream_scope_matches (error, 0));
    TEST_ASSERT_TRUE (rsframe::stream_scope_matches (error, 5));
}

int main (void)
{
    UNITY_BEGIN ();

    setup_test_environment ();

    RUN_TEST (test_request_types);
    RUN_TEST (test_payload_and_control_types);
    RUN_TEST (test_unknown_type);
    RUN_TEST (test_raw_code_queries);
    RUN_TEST (test_stream_id_classification);
    RUN_TEST (test_stream_scope);

    return UNITY_END ();
}
