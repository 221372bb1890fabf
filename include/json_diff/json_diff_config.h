// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_diff_config.h
/// @brief Centralized configuration for json_diff and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by json_diff:
///   - immer: persistent containers backing the Value tree
///   - boost: multiprecision decimals for number comparison
///
/// It MUST be included before any immer header so every translation unit
/// sees the same settings. All json_diff public headers include it first.
///
/// Unlike a single-threaded state store, the diff engine is expected to be
/// called from several threads on independent documents, so the default
/// memory policy keeps immer's atomic reference counting.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_DIFF_CONFIGURED)
#error "immer headers were included before json_diff/json_diff_config.h. " \
       "Please include json_diff headers before any direct immer includes."
#endif

#define JSON_DIFF_CONFIGURED 1

// ============================================================
// Threading Model
// ============================================================

/// @brief Select the single-threaded immer memory policy for json_diff::Value
///
/// When set to 1:
/// - Value uses non-atomic reference counting and an unlocked free list
/// - Values must never be shared across threads
///
/// Default (0): Value uses immer::default_memory_policy (thread-safe).
#ifndef JSON_DIFF_SINGLE_THREADED
#define JSON_DIFF_SINGLE_THREADED 0
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking (MSVC). Only header-only Boost is used.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Log accessor misuse and invalid pointers to stderr
///
/// Enabled by default in debug builds, disabled when NDEBUG is defined.
/// To explicitly enable: #define json_diff_VERBOSE_LOG 1
#ifndef json_diff_VERBOSE_LOG
#  if defined(NDEBUG)
#    define json_diff_VERBOSE_LOG 0
#  else
#    define json_diff_VERBOSE_LOG 1
#  endif
#endif

/// @brief Trace patch generation (operation counts, timings) to stderr
#ifndef json_diff_TRACE_LOG
#define json_diff_TRACE_LOG 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSON_DIFF_CONFIG_VERBOSE
#if JSON_DIFF_SINGLE_THREADED
#pragma message("json_diff: single-threaded memory policy")
#else
#pragma message("json_diff: thread-safe memory policy")
#endif
#endif
