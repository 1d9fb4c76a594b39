// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Immutable, segment-based location inside a document tree.
///
/// A Path is an ordered list of non-empty string segments. The empty path is
/// the root. Paths are plain values: every "modifying" operation returns a new
/// Path and leaves the original untouched.
///
/// ## Usage Examples
///
/// ```cpp
/// auto p = Path::from_string("/users/alice");      // ["users", "alice"]
/// auto name = p.child("name");                       // ["users", "alice", "name"]
/// auto same = Path{"users", "alice"} / "name";       // operator/ is child()
/// for (const auto& seg : name.segments()) { ... }   // restartable iteration
/// ```
///
/// Slash-delimited strings and segment lists are interchangeable: empty pieces
/// ("//", leading or trailing "/") are dropped, so "", "/" and "//" all name
/// the root.

#pragma once

#include <sync_tree/api.h>

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sync_tree {

class SYNC_TREE_API Path {
public:
    using value_type = std::string;
    using const_iterator = std::vector<std::string>::const_iterator;
    using size_type = std::size_t;

    /// Root path (zero segments)
    Path() = default;

    /// Build from a list of segments; each entry may itself contain '/'
    Path(std::initializer_list<std::string_view> segments);

    /// Parse a slash-delimited path expression
    [[nodiscard]] static Path from_string(std::string_view path_str);

    /// Build from an already split segment list
    [[nodiscard]] static Path from_segments(const std::vector<std::string>& segments);

    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }

    [[nodiscard]] const_iterator begin() const noexcept { return segments_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return segments_.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

    [[nodiscard]] const std::string& operator[](std::size_t i) const noexcept { return segments_[i]; }

    /// Append one segment (or several, if @p segment contains '/')
    [[nodiscard]] Path child(std::string_view segment) const;

    /// Path without its last segment. The root is its own parent.
    [[nodiscard]] Path parent() const;

    /// Last segment, or an empty string for the root
    [[nodiscard]] std::string key() const;

    /// True if @p other is this path or lies below it
    [[nodiscard]] bool contains(const Path& other) const noexcept;

    /// "/a/b/c"; the root renders as "/"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Path& a, const Path& b) noexcept { return a.segments_ == b.segments_; }
    friend bool operator!=(const Path& a, const Path& b) noexcept { return !(a == b); }
    friend bool operator<(const Path& a, const Path& b) noexcept { return a.segments_ < b.segments_; }

    friend Path operator/(const Path& base, std::string_view segment) { return base.child(segment); }

private:
    void append(std::string_view expr);

    std::vector<std::string> segments_;
};

SYNC_TREE_API std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace sync_tree
