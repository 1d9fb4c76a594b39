// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sync_tree_config.h
/// @brief Centralized compile-time configuration for sync_tree and its dependencies
///
/// This file fixes the settings of the third-party libraries sync_tree is built on:
///   - immer: persistent map/box backing the document tree
///   - lager: store + reducer driving the synchronization engine
///   - zug:   transducer utilities pulled in by lager
///
/// It MUST be included before any immer or lager header. Every public sync_tree
/// header includes it first, so users who only include sync_tree headers are covered.
///
/// Unlike a single-threaded editor model, a synchronized document is written by the
/// application thread and by the transport's receive thread, and snapshots are handed
/// across threads. immer's thread safety is therefore left ENABLED (atomic refcounts).

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(SYNC_TREE_CONFIGURED)
#error "immer headers were included before sync_tree/sync_tree_config.h. " \
       "Please include sync_tree headers before any direct immer includes."
#endif

#define SYNC_TREE_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "sync_tree shares Value trees across threads; IMMER_NO_THREAD_SAFETY must not be set."
#endif

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
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
// Lager Settings
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// The sync store has no dependencies; skipping the checks keeps compile
/// times down and avoids boost::hana template issues on MSVC.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Settings
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Verbose diagnostics on std::cerr
///
/// When enabled, failed lookups, dropped incoming messages and throwing
/// observers are reported with their call site. Defaults to on in debug
/// builds and off under NDEBUG.
///
/// To force: #define SYNC_TREE_VERBOSE_LOG 1 (or 0)
#ifndef SYNC_TREE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define SYNC_TREE_VERBOSE_LOG 0
#  else
#    define SYNC_TREE_VERBOSE_LOG 1
#  endif
#endif

#ifdef SYNC_TREE_CONFIG_VERBOSE
#pragma message("sync_tree: immer thread safety ENABLED")
#if SYNC_TREE_VERBOSE_LOG
#pragma message("sync_tree: verbose diagnostics ENABLED")
#endif
#endif
