/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RSFRAME_MACROS_HPP_INCLUDED__
#define __RSFRAME_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  rsframe Internal Use                                                      */
/******************************************************************************/

#define LIBRSFRAME_UNUSED(object) (void) object

/******************************************************************************/

#if !defined RSFRAME_NON_COPYABLE_NOR_MOVABLE
#define RSFRAME_NON_COPYABLE_NOR_MOVABLE(classname)                            \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#endif

#endif
