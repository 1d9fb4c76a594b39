// value.cpp - Value type utilities

#include <sync_tree/value.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace sync_tree {

namespace {

std::string priority_suffix(const Priority& p)
{
    if (auto* num = std::get_if<double>(&p)) {
        std::ostringstream oss;
        oss << " (priority " << *num << ")";
        return oss.str();
    }
    if (auto* str = std::get_if<std::string>(&p)) {
        return " (priority \"" + *str + "\")";
    }
    return {};
}

std::vector<std::string> sorted_keys(const ValueMap& m)
{
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& [k, v] : m) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // anonymous namespace

bool identical(const Value& a, const Value& b)
{
    if (a.priority != b.priority) {
        return false;
    }
    auto* ma = a.get_if<ValueMap>();
    auto* mb = b.get_if<ValueMap>();
    if (!ma || !mb) {
        return a.data == b.data;
    }
    if (ma->size() != mb->size()) {
        return false;
    }
    for (const auto& [k, v] : *ma) {
        auto* other = mb->find(k);
        if (!other || !identical(v.get(), other->get())) {
            return false;
        }
    }
    return true;
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (auto* m = val.get_if<ValueMap>()) {
        if (has_priority(val.priority)) {
            std::cout << indent << prefix << priority_suffix(val.priority) << "\n";
        }
        // immer::map iteration order is unspecified
        for (const auto& key : sorted_keys(*m)) {
            std::cout << indent << prefix << key << ":\n";
            print_value(m->find(key)->get(), "", depth + 1);
        }
        return;
    }
    std::cout << indent << prefix << value_to_string(val) << priority_suffix(val.priority) << "\n";
}

// ============================================================
// Explicit Template Instantiation
// ============================================================

template struct BasicValue<memory_policy>;

} // namespace sync_tree
