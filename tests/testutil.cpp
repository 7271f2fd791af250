/* SPDX-License-Identifier: MPL-2.0 */
#include "testutil.hpp"
#include "testutil_unity.hpp"

void setup_test_environment ()
{
    setvbuf (stdout, NULL, _IONBF, 0);
}

std::vector<unsigned char> encode_fields (const rsframe_fields_t &fields_,
                                          bool length_prefix_)
{
    const long size = rsframe_frame_encoded_size (&fields_);
    TEST_ASSERT_SUCCESS_ERRNO (static_cast<int> (size));

    std::vector<unsigned char> out (static_cast<size_t> (size)
                                    + (length_prefix_
                                         ? RSFRAME_LENGTH_PREFIX_SIZE
                                         : 0));
    const int rc = TEST_ASSERT_SUCCESS_ERRNO (rsframe_frame_encode (
      &fields_, out.empty () ? NULL : &out[0], out.size (),
      length_prefix_ ? 1 : 0));
    TEST_ASSERT_EQUAL_UINT (out.size (), static_cast<size_t> (rc));
    return out;
}

std::string as_string (const void *data_, size_t size_)
{
    if (size_ == 0)
        return std::string ();
    return std::string (static_cast<const char *> (data_), size_);
}
