/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "../include/rsframe.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

//  Disable stdout buffering so test output interleaves with debug traces.
void setup_test_environment ();

//  Encodes the frame described by fields_ and returns its bytes. Fails the
//  running test if encoding fails.
std::vector<unsigned char> encode_fields (const rsframe_fields_t &fields_,
                                          bool length_prefix_ = false);

//  Returns the content of a buffer as a string for comparisons.
std::string as_string (const void *data_, size_t size_);

#endif
