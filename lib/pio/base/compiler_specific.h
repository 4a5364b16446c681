// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_BASE_COMPILER_SPECIFIC_H_
#define LIB_PIO_BASE_COMPILER_SPECIFIC_H_

// Macros for compiler version + nonstandard keywords, e.g. __restrict.

#include <stdint.h>

// #if is shorter and safer than #ifdef. *_VERSION are zero if not detected,
// otherwise 100 * major + minor version. Note that other packages check for
// #ifdef COMPILER_MSVC, so we cannot use that same name.

#ifdef _MSC_VER
#define PIO_COMPILER_MSVC _MSC_VER
#else
#define PIO_COMPILER_MSVC 0
#endif

#ifdef __GNUC__
#define PIO_COMPILER_GCC (__GNUC__ * 100 + __GNUC_MINOR__)
#else
#define PIO_COMPILER_GCC 0
#endif

#ifdef __clang__
#define PIO_COMPILER_CLANG (__clang_major__ * 100 + __clang_minor__)
// Clang pretends to be GCC for compatibility.
#undef PIO_COMPILER_GCC
#define PIO_COMPILER_GCC 0
#else
#define PIO_COMPILER_CLANG 0
#endif

#if PIO_COMPILER_MSVC
#define PIO_RESTRICT __restrict
#elif PIO_COMPILER_GCC || PIO_COMPILER_CLANG
#define PIO_RESTRICT __restrict__
#else
#define PIO_RESTRICT
#endif

#if PIO_COMPILER_MSVC
#define PIO_INLINE __forceinline
#else
#define PIO_INLINE inline __attribute__((always_inline))
#endif

#if PIO_COMPILER_MSVC
#define PIO_NORETURN __declspec(noreturn)
#elif PIO_COMPILER_GCC || PIO_COMPILER_CLANG
#define PIO_NORETURN __attribute__((noreturn))
#else
#define PIO_NORETURN
#endif

#ifdef __has_attribute
#define PIO_HAVE_ATTRIBUTE(x) __has_attribute(x)
#else
#define PIO_HAVE_ATTRIBUTE(x) 0
#endif

// Raises warnings if the function return value is unused. Should appear as the
// first part of a function definition/declaration.
#if PIO_HAVE_ATTRIBUTE(nodiscard)
#define PIO_MUST_USE_RESULT [[nodiscard]]
#elif PIO_COMPILER_CLANG && PIO_HAVE_ATTRIBUTE(warn_unused_result)
#define PIO_MUST_USE_RESULT __attribute__((warn_unused_result))
#else
#define PIO_MUST_USE_RESULT
#endif

#if PIO_HAVE_ATTRIBUTE(__format__)
#define PIO_FORMAT(idx_fmt, idx_arg) \
  __attribute__((__format__(__printf__, idx_fmt, idx_arg)))
#else
#define PIO_FORMAT(idx_fmt, idx_arg)
#endif

#endif  // LIB_PIO_BASE_COMPILER_SPECIFIC_H_
