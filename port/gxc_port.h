/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Common portability definitions.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_PORT_H_INCLUDED
#define GXC_PORT_H_INCLUDED

/**
 * \file gxc_port.h
 *
 * Core portability definitions for GXC.
 *
 * o Defines GXC_DLL for shared library builds.
 * o Defines EQUAL() and EQUALN() string comparison macros.
 * o Defines format string and unused result annotations.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>

#ifndef _WIN32
#include <strings.h>
#endif

#if defined(_MSC_VER) && defined(GXC_DLL_EXPORTS)
#define GXC_DLL __declspec(dllexport)
#elif defined(__GNUC__) && __GNUC__ >= 4
#define GXC_DLL __attribute__((visibility("default")))
#else
#define GXC_DLL
#endif

/** Unsigned 32 bit integer */
typedef std::uint32_t GUInt32;

#if defined(_WIN32)
#define EQUALN(a, b, n) (_strnicmp(a, b, n) == 0)
#define EQUAL(a, b) (_stricmp(a, b) == 0)
#else
#define EQUALN(a, b, n) (strncasecmp(a, b, n) == 0)
#define EQUAL(a, b) (strcasecmp(a, b) == 0)
#endif

#if defined(__GNUC__)
#define GXC_PRINT_FUNC_FORMAT(format_idx, arg_idx)                             \
    __attribute__((__format__(__printf__, format_idx, arg_idx)))
#define GXC_WARN_UNUSED_RESULT __attribute__((warn_unused_result))
#else
#define GXC_PRINT_FUNC_FORMAT(format_idx, arg_idx)
#define GXC_WARN_UNUSED_RESULT
#endif

/** Consume a value whose result is intentionally not used */
template <class T> inline void GXC_IGNORE_RET_VAL(const T &)
{
}

#define GXC_DISALLOW_COPY_ASSIGN(ClassName)                                    \
    ClassName(const ClassName &) = delete;                                     \
    ClassName &operator=(const ClassName &) = delete;

#endif /* GXC_PORT_H_INCLUDED */
