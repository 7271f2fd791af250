/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_UNITY_HPP_INCLUDED__
#define __TESTUTIL_UNITY_HPP_INCLUDED__

#include "../include/rsframe.h"

#include <unity.h>

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_);

#define TEST_ASSERT_SUCCESS_MESSAGE_ERRNO(expr, msg)                           \
    test_assert_success_message_errno_helper (expr, msg, #expr, __LINE__)

#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

//  Buffer comparison against a string literal (terminator excluded).
#define TEST_ASSERT_EQUAL_BYTES(expected, data, size)                          \
    {                                                                          \
        TEST_ASSERT_EQUAL_UINT (sizeof (expected) - 1, (size));                \
        if ((size) > 0)                                                        \
            TEST_ASSERT_EQUAL_MEMORY ((expected), (data), (size));             \
    }

#endif
