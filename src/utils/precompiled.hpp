/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_PRECOMPILED_HPP_INCLUDED__
#define __RSFRAME_PRECOMPILED_HPP_INCLUDED__

#define __STDC_LIMIT_MACROS

// rsframe definitions and exported functions
#include "../include/rsframe.h"

#ifdef _MSC_VER

// standard C headers
#include <errno.h>
#include <limits.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// standard C++ headers
#include <algorithm>
#include <map>
#include <vector>

#endif // _MSC_VER

#endif //ifndef __RSFRAME_PRECOMPILED_HPP_INCLUDED__
