// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file objdiff_config.h
/// @brief Centralized compile-time configuration for objdiff and immer.
///
/// It MUST be included before any immer header so that the immer switches
/// below take effect. All objdiff public headers include it first.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OBJDIFF_CONFIGURED)
#error "immer headers were included before objdiff/objdiff_config.h. " \
       "Please include objdiff headers before any direct immer includes."
#endif

#define OBJDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Values may be shared between threads diffing through the same Differ,
// so immer's thread-safe reference counting stays enabled.
// ============================================================

#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager / Zug Settings
// ============================================================

#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging
//
// When OBJDIFF_VERBOSE_LOG is non-zero, traversal decisions (node
// classification, resolver application) are traced to stderr.
// Skipped fields and type mismatch warnings are reported regardless.
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef OBJDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OBJDIFF_VERBOSE_LOG 0
#  else
#    define OBJDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Traversal Limits
// ============================================================

/// @brief Default recursion limit for Differ (see DiffOptions::max_depth)
///
/// Object graphs built from shared pointers can contain cycles; the
/// limit turns an unbounded recursion into a DepthLimitError.
#ifndef OBJDIFF_DEFAULT_MAX_DEPTH
#define OBJDIFF_DEFAULT_MAX_DEPTH 512
#endif
