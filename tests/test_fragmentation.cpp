/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

void setUp ()
{
}

void tearDown ()
{
}

typedef std::vector<std::vector<unsigned char> > frames_t;

static frames_t fragment (const rsframe_fields_t &fields_, size_t max_)
{
    void *fragmenter = rsframe_fragmenter_new (&fields_, max_);
    TEST_ASSERT_NOT_NULL (fragmenter);

    frames_t frames;
    unsigned char buf[256];
    TEST_ASSERT_LESS_OR_EQUAL_UINT (sizeof buf, max_);
    int rc;
    while ((rc = TEST_ASSERT_SUCCESS_ERRNO (
              rsframe_fragmenter_next (fragmenter, buf, sizeof buf)))
           > 0) {
        TEST_ASSERT_LESS_OR_EQUAL_INT (static_cast<int> (max_), rc);
        frames.push_back (std::vector<unsigned char> (buf, buf + rc));
    }

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_fragmenter_close (fragmenter));
    return frames;
}

void test_fragment_and_assemble ()
{
    std::string metadata (300, 'm');
    std::string data (2000, 'd');
    for (size_t i = 0; i < data.size (); i++)
        data[i] = static_cast<char> ('a' + i % 26);

    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_REQUEST_CHANNEL, 9);
    fields.flags = RSFRAME_FLAG_COMPLETE;
    fields.request_n = 4;
    fields.has_metadata = 1;
    fields.metadata = metadata.data ();
    fields.metadata_size = metadata.size ();
    fields.data = data.data ();
    fields.data_size = data.size ();

    const frames_t frames = fragment (fields, 128);
    TEST_ASSERT_GREATER_THAN_UINT (1, frames.size ());

    void *assembler = rsframe_assembler_new ();
    TEST_ASSERT_NOT_NULL (assembler);

    rsframe_message_t msg;
    rsframe_frame_t frame;
    for (size_t i = 0; i < frames.size (); i++) {
        TEST_ASSERT_SUCCESS_ERRNO (
          rsframe_frame_decode (&frame, &frames[i][0], frames[i].size ()));
        TEST_ASSERT_EQUAL_INT (i + 1 < frames.size () ? 1 : 0,
                               rsframe_frame_has_follows (&frame));
        const int rc = TEST_ASSERT_SUCCESS_ERRNO (
          rsframe_assembler_push (assembler, &frame, &msg));
        TEST_ASSERT_EQUAL_INT (i + 1 < frames.size () ? 0 : 1, rc);
    }

    TEST_ASSERT_EQUAL_UINT32 (9, msg.stream_id);
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_CHANNEL, msg.type);
    TEST_ASSERT_TRUE (msg.flags & RSFRAME_FLAG_COMPLETE);
    TEST_ASSERT_FALSE (msg.flags & RSFRAME_FLAG_FOLLOWS);
    TEST_ASSERT_EQUAL_INT (1, msg.has_request_n);
    TEST_ASSERT_EQUAL_UINT32 (4, msg.request_n);
    TEST_ASSERT_EQUAL_INT (static_cast<int> (frames.size ()), msg.fragments);
    TEST_ASSERT_EQUAL_INT (1, msg.has_metadata);
    TEST_ASSERT_TRUE (as_string (msg.metadata, msg.metadata_size) == metadata);
    TEST_ASSERT_EQUAL_INT (1, msg.has_data);
    TEST_ASSERT_TRUE (as_string (msg.data, msg.data_size) == data);

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_finish (assembler));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_close (assembler));
}

void test_fragmenter_errors ()
{
    std::string data (100, 'x');
    rsframe_fields_t fields;

    rsframe_fields_init (&fields, RSFRAME_TYPE_KEEPALIVE, 0);
    fields.data = data.data ();
    fields.data_size = data.size ();
    TEST_ASSERT_NULL (rsframe_fragmenter_new (&fields, 64));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);

    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.data = data.data ();
    fields.data_size = data.size ();
    TEST_ASSERT_NULL (rsframe_fragmenter_new (&fields, 9));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    unsigned char buf[16];
    TEST_ASSERT_FAILURE_ERRNO (EFAULT,
                               rsframe_fragmenter_next (NULL, buf, sizeof buf));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rsframe_fragmenter_close (NULL));
}

void test_assembler_options ()
{
    void *assembler = rsframe_assembler_new ();
    TEST_ASSERT_NOT_NULL (assembler);

    int interleave = -1;
    size_t size = sizeof interleave;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_getopt (
      assembler, RSFRAME_INTERLEAVE_FRAGMENTS, &interleave, &size));
    TEST_ASSERT_EQUAL_INT (1, interleave);

    interleave = 0;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_setopt (
      assembler, RSFRAME_INTERLEAVE_FRAGMENTS, &interleave, sizeof interleave));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_getopt (
      assembler, RSFRAME_INTERLEAVE_FRAGMENTS, &interleave, &size));
    TEST_ASSERT_EQUAL_INT (0, interleave);

    const int64_t limit = 1024;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_setopt (
      assembler, RSFRAME_MAX_REASSEMBLY_SIZE, &limit, sizeof limit));

    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, rsframe_assembler_setopt (assembler, 42, &limit, sizeof limit));

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_close (assembler));
}

void test_assembler_incomplete_and_cancel ()
{
    std::string data (50, 'x');
    rsframe_fields_t fields;
    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 3);
    fields.flags = RSFRAME_FLAG_NEXT;
    fields.data = data.data ();
    fields.data_size = data.size ();
    const frames_t frames = fragment (fields, 32);
    TEST_ASSERT_EQUAL_UINT (2, frames.size ());

    void *assembler = rsframe_assembler_new ();
    rsframe_frame_t frame;
    rsframe_message_t msg;
    TEST_ASSERT_SUCCESS_ERRNO (
      rsframe_frame_decode (&frame, &frames[0][0], frames[0].size ()));

    TEST_ASSERT_EQUAL_INT (0, rsframe_assembler_push (assembler, &frame, &msg));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_cancel (assembler, 3));
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_finish (assembler));

    TEST_ASSERT_EQUAL_INT (0, rsframe_assembler_push (assembler, &frame, &msg));
    TEST_ASSERT_FAILURE_ERRNO (EINCOMPLETE, rsframe_assembler_finish (assembler));

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_assembler_close (assembler));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rsframe_assembler_finish (NULL));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_fragment_and_assemble);
    RUN_TEST (test_fragmenter_errors);
    RUN_TEST (test_assembler_options);
    RUN_TEST (test_assembler_incomplete_and_cancel);
    return UNITY_END ();
}
