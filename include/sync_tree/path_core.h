// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.h
/// @brief Persistent path-addressed edits on Value trees.
///
/// Every function here takes a root and returns a new root. Nothing is
/// modified in place: the chain of ancestors from the root to the edited node
/// is rebuilt and every other subtree is shared with the input.
///
/// ## Usage Examples
///
/// ```cpp
/// Value root = Value::map();
/// root = insert_at_path(root, Path{"a", "b"}, Value::map({{"x", 1}}));
/// root = merge_at_path(root, Path{"a", "b"}, Value::map({{"y", 2}}));
/// auto found = get_at_path(root, Path{"a", "b", "y"});   // 2
/// root = erase_at_path(root, Path{"a", "b"});             // "/a" is now {}
/// ```

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/path.h>
#include <sync_tree/value.h>

#include <optional>

namespace sync_tree {

// ============================================================
// Lookup
// ============================================================

/// Walk @p path from @p root.
/// @return The node, or std::nullopt if any segment is missing
[[nodiscard]] SYNC_TREE_API std::optional<Value> get_at_path(const Value& root, const Path& path);

// ============================================================
// Edits
// ============================================================

/// Assign @p new_val at @p path wholesale.
///
/// Missing intermediate segments are created as empty maps while descending.
/// An intermediate that holds a scalar is replaced by an empty map.
/// Inserting at the root returns @p new_val.
[[nodiscard]] SYNC_TREE_API Value insert_at_path(const Value& root, const Path& path, Value new_val);

/// Replace semantics of a Set.
///
/// - null members of @p new_val are pruned before insertion
/// - a null @p new_val erases the subtree (see erase_at_path)
/// - when the existing node and @p new_val are both scalars and @p new_val
///   carries no priority, the existing priority is kept
[[nodiscard]] SYNC_TREE_API Value replace_at_path(const Value& root, const Path& path, Value new_val);

/// One-level merge of @p incoming into @p target.
///
/// - scalar onto scalar: value replaced
/// - scalar onto map: no change
/// - map onto anything: each non-null direct child of @p incoming replaces
///   the same child of @p target wholesale (scalar children keep their
///   priority); children not named are left untouched
/// - a priority on @p incoming replaces the target's priority
[[nodiscard]] SYNC_TREE_API Value merge_values(const Value& target, const Value& incoming);

/// Merge @p incoming into the node at @p path.
/// If nothing exists at @p path, @p incoming (nulls pruned) is inserted.
[[nodiscard]] SYNC_TREE_API Value merge_at_path(const Value& root, const Path& path, const Value& incoming);

/// Detach the subtree at @p path from its parent.
/// Erasing the root yields an empty map. A missing path leaves @p root unchanged.
/// Parents left empty are kept as empty maps.
[[nodiscard]] SYNC_TREE_API Value erase_at_path(const Value& root, const Path& path);

/// Attach @p priority to the node at @p path, creating it as an empty map
/// (and any missing ancestors) when absent. std::monostate clears it.
[[nodiscard]] SYNC_TREE_API Value set_priority_at_path(const Value& root, const Path& path, Priority priority);

} // namespace sync_tree
