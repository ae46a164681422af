// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file objgraph_config.h
/// @brief Centralized compile-time configuration for objgraph and immer.
///
/// This file defines:
///   - immer tuning macros (objgraph values are single-threaded by default)
///   - the initial serialization policy (SerializeOptions defaults)
///   - decoder limits
///   - the logging switch (see log.h)
///
/// It MUST be included before any immer header. All objgraph public headers
/// include it first, so users who only include objgraph headers don't need
/// to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OBJGRAPH_CONFIGURED)
#error "immer headers were included before objgraph/objgraph_config.h. " \
       "Please include objgraph headers before any direct immer includes."
#endif

#define OBJGRAPH_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic refcounts and lock-free free lists.
/// Value trees are built and consumed on one thread (see SyncValue otherwise).
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief No per-node type tags (smaller nodes, no assertion overhead)
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
// Serialization Policy Defaults
//
// These only seed SerializeOptions / CloneOptions; every Serializer
// and Cloner can override them at runtime.
// ============================================================

/// @brief Skip fields whose name starts with '_' (private by convention)
#ifndef OBJGRAPH_DEFAULT_SKIP_UNDERSCORE
#define OBJGRAPH_DEFAULT_SKIP_UNDERSCORE 1
#endif

/// @brief Write fields equal to the type's default value (0 = elide them)
#ifndef OBJGRAPH_DEFAULT_SERIALIZE_DEFAULTS
#define OBJGRAPH_DEFAULT_SERIALIZE_DEFAULTS 0
#endif

/// @brief Fail on untagged nested objects instead of writing null
#ifndef OBJGRAPH_DEFAULT_STRICT
#define OBJGRAPH_DEFAULT_STRICT 0
#endif

// ============================================================
// Decoder Limits
// ============================================================

/// @brief Maximum container nesting accepted by the text/JSON/binary decoders
#ifndef OBJGRAPH_MAX_DECODE_DEPTH
#define OBJGRAPH_MAX_DECODE_DEPTH 512
#endif

// ============================================================
// Verbose Logging
//
// When OBJGRAPH_VERBOSE_LOG is 1, warnings (downgraded unsupported
// values, unknown fields skipped on load, failed Value lookups) are
// written to stderr. Enabled in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef OBJGRAPH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OBJGRAPH_VERBOSE_LOG 0
#  else
#    define OBJGRAPH_VERBOSE_LOG 1
#  endif
#endif

#ifdef OBJGRAPH_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("objgraph: immer thread safety DISABLED")
#else
#pragma message("objgraph: immer thread safety ENABLED")
#endif
#if OBJGRAPH_DEFAULT_SERIALIZE_DEFAULTS
#pragma message("objgraph: default-value elision OFF by default")
#endif
#endif // OBJGRAPH_CONFIG_VERBOSE
