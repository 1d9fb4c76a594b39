// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Implementation of the segment-based Path type.

#include <sync_tree/path.h>

#include <algorithm>

namespace sync_tree {

Path::Path(std::initializer_list<std::string_view> segments)
{
    segments_.reserve(segments.size());
    for (auto seg : segments) {
        append(seg);
    }
}

Path Path::from_string(std::string_view path_str)
{
    Path result;
    result.append(path_str);
    return result;
}

Path Path::from_segments(const std::vector<std::string>& segments)
{
    Path result;
    result.segments_.reserve(segments.size());
    for (const auto& seg : segments) {
        result.append(seg);
    }
    return result;
}

void Path::append(std::string_view expr)
{
    // Split by '/', dropping empty pieces
    while (!expr.empty()) {
        auto pos = expr.find('/');
        std::string_view segment = (pos == std::string_view::npos) ? expr : expr.substr(0, pos);
        if (!segment.empty()) {
            segments_.emplace_back(segment);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        expr = expr.substr(pos + 1);
    }
}

Path Path::child(std::string_view segment) const
{
    Path result = *this;
    result.append(segment);
    return result;
}

Path Path::parent() const
{
    if (segments_.empty()) {
        return *this;
    }
    Path result;
    result.segments_.assign(segments_.begin(), segments_.end() - 1);
    return result;
}

std::string Path::key() const
{
    return segments_.empty() ? std::string{} : segments_.back();
}

bool Path::contains(const Path& other) const noexcept
{
    if (other.segments_.size() < segments_.size()) {
        return false;
    }
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

std::string Path::to_string() const
{
    if (segments_.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& seg : segments_) {
        result += '/';
        result += seg;
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Path& path)
{
    return os << path.to_string();
}

} // namespace sync_tree
