// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file priority.h
/// @brief Total order over sibling nodes based on their priority.
///
/// Ordering rules:
/// 1. no priority < numeric priority < string priority
/// 2. numbers ascending, strings by byte-wise comparison
/// 3. ties broken by child key, byte-wise ascending
///
/// Priority only affects presentation order. It is never consulted when a
/// node is stored, merged or compared for equality.

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/value.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sync_tree {

/// False for a numeric priority that is NaN or infinite. Writes reject such
/// priorities; they have no JSON form.
[[nodiscard]] SYNC_TREE_API bool is_valid_priority(const Priority& p) noexcept;

/// Three-way comparison of two priorities.
/// A NaN number sorts after every other number so the order stays total.
/// @return negative, zero or positive
[[nodiscard]] SYNC_TREE_API int compare_priority(const Priority& a, const Priority& b) noexcept;

/// Strict weak ordering over (key, node) pairs following the rules above
struct SYNC_TREE_API PriorityOrder {
    [[nodiscard]] bool operator()(const std::pair<std::string, Value>& a,
                                  const std::pair<std::string, Value>& b) const noexcept;
};

/// Direct children of @p node, sorted by PriorityOrder. Empty for scalars.
[[nodiscard]] SYNC_TREE_API std::vector<std::pair<std::string, Value>> ordered_children(const Value& node);

} // namespace sync_tree
