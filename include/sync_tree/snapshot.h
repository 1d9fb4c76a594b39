// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file snapshot.h
/// @brief DataSnapshot - read-only, point-in-time view of one location.
///
/// A snapshot pairs a Path with the Value found there when it was taken (or
/// with "absent"). It holds its own reference to the immutable tree, so it
/// stays valid and unchanged however long the caller keeps it. Later writes
/// to the database are not visible through it.

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/path.h>
#include <sync_tree/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sync_tree {

class SYNC_TREE_API DataSnapshot {
public:
    /// Absent snapshot at @p path
    explicit DataSnapshot(Path path);

    DataSnapshot(Path path, std::optional<Value> value);

    [[nodiscard]] const Path& path() const noexcept { return path_; }

    /// Last path segment; empty for the root
    [[nodiscard]] std::string key() const { return path_.key(); }

    [[nodiscard]] bool exists() const noexcept { return exists_; }

    /// The stored value; null when absent
    [[nodiscard]] const Value& value() const noexcept { return value_; }

    [[nodiscard]] const Priority& priority() const noexcept { return value_.priority; }

    /// Snapshot of a descendant. @p relative may contain '/'.
    [[nodiscard]] DataSnapshot child(std::string_view relative) const;

    [[nodiscard]] bool has_child(std::string_view relative) const;

    [[nodiscard]] bool has_children() const noexcept { return value_.size() > 0; }

    [[nodiscard]] std::size_t num_children() const noexcept { return value_.size(); }

    /// Direct children in priority order
    [[nodiscard]] std::vector<DataSnapshot> children() const;

    /// JSON text of the value ("null" when absent)
    [[nodiscard]] std::string to_json(bool compact = true) const;

private:
    Path path_;
    Value value_;
    bool exists_ = false;
};

} // namespace sync_tree
