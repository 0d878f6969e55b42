/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

// This file is mostly based on folly/CppAttributes.h

#ifndef __has_extension
#define TE_HAS_EXTENSION(x) 0
#else
#define TE_HAS_EXTENSION(x) __has_extension(x)
#endif

#if defined(__GNUC__) || defined(__clang__)
#define TE_PUSH_WARNING _Pragma("GCC diagnostic push")
#define TE_POP_WARNING _Pragma("GCC diagnostic pop")
#define TE_GNU_DISABLE_WARNING_INTERNAL2(warningName) #warningName
#define TE_GNU_DISABLE_WARNING(warningName) \
  _Pragma(TE_GNU_DISABLE_WARNING_INTERNAL2(GCC diagnostic ignored warningName))
#ifdef __clang__
#define TE_CLANG_DISABLE_WARNING(warningName) \
  TE_GNU_DISABLE_WARNING(warningName)
#else
#define TE_CLANG_DISABLE_WARNING(warningName)
#endif
#define TE_ALWAYS_INLINE inline __attribute__((__always_inline__))
#else
#define TE_PUSH_WARNING
#define TE_POP_WARNING
#define TE_GNU_DISABLE_WARNING(warningName)
#define TE_CLANG_DISABLE_WARNING(warningName)
#define TE_ALWAYS_INLINE inline
#endif

/**
 * Nullable indicates that a return value or a parameter may be a `nullptr`,
 * e.g.
 *
 * const Sanitizer* TE_NULLABLE find(const std::string& name);
 *
 * Ignores Clang's -Wnullability-extension since it correctly handles the case
 * where the extension is not present.
 */
#if TE_HAS_EXTENSION(nullability)
#define TE_NULLABLE                                   \
  TE_PUSH_WARNING                                     \
  TE_CLANG_DISABLE_WARNING("-Wnullability-extension") \
  _Nullable TE_POP_WARNING
#else
#define TE_NULLABLE
#endif
