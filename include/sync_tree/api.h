// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#pragma once

/// @file api.h
/// @brief Export/import macros for building sync_tree as a static or shared library.
///
/// - Shared build: CMake defines SYNC_TREE_EXPORTS (private) and SYNC_TREE_SHARED (public),
///   so classes and functions marked SYNC_TREE_API are exported while building
///   and imported by consumers.
/// - Static build: neither macro is defined and SYNC_TREE_API expands to nothing.
///
/// @code
/// class SYNC_TREE_API SyncDatabase { ... };
/// SYNC_TREE_API std::string to_json(const Value& val, bool compact);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SYNC_TREE_SHARED
        #ifdef SYNC_TREE_EXPORTS
            #define SYNC_TREE_API __declspec(dllexport)
        #else
            #define SYNC_TREE_API __declspec(dllimport)
        #endif
    #else
        #define SYNC_TREE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(SYNC_TREE_SHARED) && defined(SYNC_TREE_EXPORTS)
        #define SYNC_TREE_API __attribute__((visibility("default")))
    #else
        #define SYNC_TREE_API
    #endif
#else
    #define SYNC_TREE_API
#endif
