/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Low level portability services for the FGL layer. This should
 *           be the first include file for any FGL based code.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FGL_PORT_H_INCLUDED
#define FGL_PORT_H_INCLUDED

/* ==================================================================== */
/*      Standard include files.                                         */
/* ==================================================================== */

#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <stdarg.h>
#include <string.h>
#include <strings.h>

#include <cstdint>

/* ==================================================================== */
/*      Core types.                                                     */
/* ==================================================================== */

typedef std::int8_t GInt8;
typedef std::uint8_t GByte;
typedef std::int16_t GInt16;
typedef std::uint16_t GUInt16;
typedef std::int32_t GInt32;
typedef std::uint32_t GUInt32;
typedef std::int64_t GInt64;
typedef std::uint64_t GUInt64;

/* ==================================================================== */
/*      Other standard services.                                        */
/* ==================================================================== */

#if defined(_MSC_VER)
#define FGL_DLL
#elif defined(__GNUC__) && __GNUC__ >= 4
#define FGL_DLL __attribute__((visibility("default")))
#else
#define FGL_DLL
#endif

#if defined(__GNUC__)
#define FGL_PRINT_FUNC_FORMAT(format_idx, arg_idx)                             \
    __attribute__((__format__(__printf__, format_idx, arg_idx)))
#define FGL_WARN_UNUSED_RESULT __attribute__((warn_unused_result))
#else
#define FGL_PRINT_FUNC_FORMAT(format_idx, arg_idx)
#define FGL_WARN_UNUSED_RESULT
#endif

/** Case insensitive string comparison */
#define EQUAL(a, b) (strcasecmp(a, b) == 0)
/** Case insensitive comparison of the first n characters */
#define EQUALN(a, b, n) (strncasecmp(a, b, n) == 0)
/** Case insensitive test that a starts with b */
#define STARTS_WITH_CI(a, b) EQUALN(a, b, strlen(b))

/** Disable the copy constructor and assignment operator of a class */
#define FGL_DISALLOW_COPY_ASSIGN(ClassName)                                    \
    ClassName(const ClassName &) = delete;                                     \
    ClassName &operator=(const ClassName &) = delete;

/** Silence a "return value ignored" warning */
template <class T> inline void FGL_IGNORE_RET_VAL(const T &)
{
}

/** Array of const strings, typically a NAME=VALUE option list terminated
 * by a null pointer. */
typedef const char *const *FGLConstList;

#endif /* FGL_PORT_H_INCLUDED */
