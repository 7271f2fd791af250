/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <algorithm>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<unsigned char> sample_stream ()
{
    std::vector<unsigned char> stream;
    rsframe_fields_t fields;

    rsframe_fields_init (&fields, RSFRAME_TYPE_REQUEST_RESPONSE, 1);
    fields.has_metadata = 1;
    fields.metadata = "svc";
    fields.metadata_size = 3;
    fields.data = "ping";
    fields.data_size = 4;
    std::vector<unsigned char> frame = encode_fields (fields, true);
    stream.insert (stream.end (), frame.begin (), frame.end ());

    rsframe_fields_init (&fields, RSFRAME_TYPE_PAYLOAD, 1);
    fields.flags = RSFRAME_FLAG_NEXT | RSFRAME_FLAG_COMPLETE;
    fields.data = "pong";
    fields.data_size = 4;
    frame = encode_fields (fields, true);
    stream.insert (stream.end (), frame.begin (), frame.end ());

    rsframe_fields_init (&fields, RSFRAME_TYPE_KEEPALIVE, 0);
    fields.position = 12;
    frame = encode_fields (fields, true);
    stream.insert (stream.end (), frame.begin (), frame.end ());
    return stream;
}

//  Feeds stream_ in chunks of chunk_ bytes and records the frame types.
static std::vector<int> decode_in_chunks (const std::vector<unsigned char> &stream_,
                                          size_t chunk_)
{
    void *decoder = rsframe_stream_decoder_new ();
    TEST_ASSERT_NOT_NULL (decoder);

    std::vector<int> types;
    size_t offset = 0;
    while (offset < stream_.size ()) {
        const size_t end = std::min (offset + chunk_, stream_.size ());
        while (offset < end) {
            size_t consumed = 0;
            rsframe_frame_t frame;
            const int rc = TEST_ASSERT_SUCCESS_ERRNO (
              rsframe_stream_decoder_decode (decoder, &stream_[offset],
                                             end - offset, &consumed, &frame));
            offset += consumed;
            if (rc == 1) {
                types.push_back (rsframe_frame_type (&frame));
                if (rsframe_frame_type (&frame) == RSFRAME_TYPE_PAYLOAD) {
                    const void *data;
                    size_t size;
                    TEST_ASSERT_SUCCESS_ERRNO (
                      rsframe_frame_data (&frame, &data, &size));
                    TEST_ASSERT_EQUAL_BYTES ("pong", data, size);
                }
            }
        }
    }

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_stream_decoder_close (decoder));
    return types;
}

void test_any_chunking ()
{
    const std::vector<unsigned char> stream = sample_stream ();
    const size_t chunks[] = {1, 2, 3, 5, 7, 16, 1024};

    for (size_t i = 0; i < sizeof chunks / sizeof chunks[0]; i++) {
        const std::vector<int> types = decode_in_chunks (stream, chunks[i]);
        TEST_ASSERT_EQUAL_UINT (3, types.size ());
        TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_RESPONSE, types[0]);
        TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_PAYLOAD, types[1]);
        TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_KEEPALIVE, types[2]);
    }
}

void test_decoder_errors ()
{
    void *decoder = rsframe_stream_decoder_new ();
    TEST_ASSERT_NOT_NULL (decoder);

    const int max = 16;
    TEST_ASSERT_SUCCESS_ERRNO (rsframe_stream_decoder_setopt (
      decoder, RSFRAME_MAX_FRAME_SIZE, &max, sizeof max));

    const unsigned char oversized[] = {0x00, 0x00, 0x11};
    size_t consumed = 0;
    rsframe_frame_t frame;
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, rsframe_stream_decoder_decode (decoder, oversized,
                                               sizeof oversized, &consumed,
                                               &frame));
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM, rsframe_stream_decoder_decode (decoder, oversized, sizeof oversized,
                                           &consumed, &frame));

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_stream_decoder_reset (decoder));
    const std::vector<unsigned char> stream = sample_stream ();
    TEST_ASSERT_EQUAL_INT (
      1, rsframe_stream_decoder_decode (decoder, &stream[0], stream.size (),
                                        &consumed, &frame));
    TEST_ASSERT_EQUAL_INT (RSFRAME_TYPE_REQUEST_RESPONSE,
                           rsframe_frame_type (&frame));

    TEST_ASSERT_SUCCESS_ERRNO (rsframe_stream_decoder_close (decoder));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, rsframe_stream_decoder_reset (NULL));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_any_chunking);
    RUN_TEST (test_decoder_errors);
    return UNITY_END ();
}
