// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file query.h
/// @brief Ordered / limited views over the children of a snapshot.
///
/// A Query holds one ordering and at most one limit:
///
/// | Call                  | Query parameter          | Effect                                   |
/// |-----------------------|--------------------------|------------------------------------------|
/// | order_by_priority()   | orderBy="$priority"      | PriorityOrder (the default)              |
/// | order_by_key()        | orderBy="$key"           | child key ascending                      |
/// | order_by_child("c")   | orderBy="c"              | value of child "c", then key             |
/// | limit_to_first(n)     | limitToFirst=n           | first n children of the ordering         |
/// | limit_to_last(n)      | limitToLast=n            | last n children of the ordering          |
///
/// Anything else (startAt, endAt, equalTo, orderBy="$value", unknown
/// parameters) throws unsupported_query. Nothing is silently ignored.
///
/// Usage:
/// @code
///   auto latest = Query{}.order_by_key().limit_to_last(2).apply(db.snapshot_for("/messages"));
///   auto same   = Query::parse(R"(orderBy="$key"&limitToLast=2)").apply(snap);
/// @endcode

#pragma once

#include <sync_tree/api.h>
#include <sync_tree/snapshot.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sync_tree {

/// Thrown for a filter the engine cannot evaluate
class SYNC_TREE_API unsupported_query : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SYNC_TREE_API Query {
public:
    enum class Order { Priority, Key, Child };
    enum class Limit { First, Last };

    Query() = default;

    Query& order_by_priority();
    Query& order_by_key();
    Query& order_by_child(std::string child_key);

    /// @throws std::invalid_argument if @p n is zero
    Query& limit_to_first(std::size_t n);

    /// @throws std::invalid_argument if @p n is zero
    Query& limit_to_last(std::size_t n);

    /// Build from URL-style parameters, e.g. `orderBy="$priority"&limitToFirst=3`
    /// @throws unsupported_query, std::invalid_argument
    [[nodiscard]] static Query parse(std::string_view params);

    [[nodiscard]] Order order() const noexcept { return order_; }
    [[nodiscard]] const std::string& order_child() const noexcept { return order_child_; }
    [[nodiscard]] std::optional<Limit> limit_kind() const noexcept { return limit_kind_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

    /// Children of @p snapshot after ordering and limiting.
    /// An absent or scalar snapshot yields an empty list.
    [[nodiscard]] std::vector<DataSnapshot> apply(const DataSnapshot& snapshot) const;

private:
    Query& set_limit(Limit kind, std::size_t n);

    Order order_ = Order::Priority;
    std::string order_child_;
    std::optional<Limit> limit_kind_;
    std::size_t limit_ = 0;
};

/// Order of plain values used by order_by_child:
/// null < false < true < numbers < strings < maps
[[nodiscard]] SYNC_TREE_API int compare_values(const Value& a, const Value& b) noexcept;

} // namespace sync_tree
