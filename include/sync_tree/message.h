// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file message.h
/// @brief The unit of mutation exchanged with the transport.

#pragma once

#include <sync_tree/path.h>
#include <sync_tree/value.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sync_tree {

enum class WriteBehavior : std::uint8_t {
    Replace, ///< wholesale substitution at path
    Merge    ///< one-level merge of named children
};

/// Result reported to the caller of a write
struct WriteStatus {
    bool success = true;
    std::string error;
};

using StatusCallback = std::function<void(const WriteStatus&)>;

/// A change to apply at one path.
///
/// An absent @c value always means "delete the subtree at path", whatever
/// the behavior. @c value holds the raw payload text: text starting with '{'
/// is JSON, anything else is a string scalar.
struct Message {
    WriteBehavior behavior = WriteBehavior::Replace;
    Path path;
    std::optional<std::string> value;
    std::optional<Priority> priority;
    StatusCallback callback;

    [[nodiscard]] bool is_delete() const noexcept { return !value.has_value(); }
};

} // namespace sync_tree
