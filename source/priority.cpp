// priority.cpp - sibling ordering by priority

#include <sync_tree/priority.h>

#include <algorithm>
#include <cmath>

namespace sync_tree {

bool is_valid_priority(const Priority& p) noexcept
{
    if (auto* d = std::get_if<double>(&p)) {
        return std::isfinite(*d);
    }
    return true;
}

int compare_priority(const Priority& a, const Priority& b) noexcept
{
    // variant index already encodes none < number < string
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    if (auto* da = std::get_if<double>(&a)) {
        double db = std::get<double>(b);
        bool a_nan = std::isnan(*da);
        bool b_nan = std::isnan(db);
        if (a_nan || b_nan) {
            return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
        }
        if (*da < db) return -1;
        if (db < *da) return 1;
        return 0;
    }
    if (auto* sa = std::get_if<std::string>(&a)) {
        int c = sa->compare(std::get<std::string>(b));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return 0;
}

bool PriorityOrder::operator()(const std::pair<std::string, Value>& a,
                               const std::pair<std::string, Value>& b) const noexcept
{
    int c = compare_priority(a.second.priority, b.second.priority);
    if (c != 0) {
        return c < 0;
    }
    return a.first < b.first;
}

std::vector<std::pair<std::string, Value>> ordered_children(const Value& node)
{
    std::vector<std::pair<std::string, Value>> children;
    if (auto* m = node.get_if<ValueMap>()) {
        children.reserve(m->size());
        for (const auto& [key, boxed] : *m) {
            children.emplace_back(key, boxed.get());
        }
        std::sort(children.begin(), children.end(), PriorityOrder{});
    }
    return children;
}

} // namespace sync_tree
