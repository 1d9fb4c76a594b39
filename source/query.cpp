// query.cpp - ordering and limit views

#include <sync_tree/query.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sync_tree {

namespace {

int value_rank(const Value& v) noexcept
{
    if (v.is_null()) return 0;
    if (auto* b = v.get_if<bool>()) return *b ? 2 : 1;
    if (v.is_number()) return 3;
    if (v.is<std::string>()) return 4;
    return 5;
}

std::string_view unquote(std::string_view s)
{
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::size_t parse_limit(std::string_view name, std::string_view text)
{
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument(std::string(name) + ": not a count: '" + std::string(text) + "'");
    }
    return n;
}

} // anonymous namespace

int compare_values(const Value& a, const Value& b) noexcept
{
    int ra = value_rank(a);
    int rb = value_rank(b);
    if (ra != rb) {
        return ra < rb ? -1 : 1;
    }
    if (ra == 3) {
        double da = a.as_number();
        double db = b.as_number();
        return da < db ? -1 : (db < da ? 1 : 0);
    }
    if (ra == 4) {
        int c = a.get_if<std::string>()->compare(*b.get_if<std::string>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return 0;
}

Query& Query::order_by_priority()
{
    order_ = Order::Priority;
    order_child_.clear();
    return *this;
}

Query& Query::order_by_key()
{
    order_ = Order::Key;
    order_child_.clear();
    return *this;
}

Query& Query::order_by_child(std::string child_key)
{
    if (child_key.empty()) {
        throw std::invalid_argument("order_by_child: empty child key");
    }
    order_ = Order::Child;
    order_child_ = std::move(child_key);
    return *this;
}

Query& Query::limit_to_first(std::size_t n)
{
    return set_limit(Limit::First, n);
}

Query& Query::limit_to_last(std::size_t n)
{
    return set_limit(Limit::Last, n);
}

Query& Query::set_limit(Limit kind, std::size_t n)
{
    if (n == 0) {
        throw std::invalid_argument("query limit must be greater than zero");
    }
    if (limit_kind_ && *limit_kind_ != kind) {
        throw std::invalid_argument("limitToFirst and limitToLast cannot be combined");
    }
    limit_kind_ = kind;
    limit_ = n;
    return *this;
}

Query Query::parse(std::string_view params)
{
    Query query;
    while (!params.empty()) {
        auto amp = params.find('&');
        std::string_view item = params.substr(0, amp);
        params = (amp == std::string_view::npos) ? std::string_view{} : params.substr(amp + 1);
        if (item.empty()) {
            continue;
        }

        auto eq = item.find('=');
        std::string_view name = item.substr(0, eq);
        std::string_view arg = (eq == std::string_view::npos) ? std::string_view{} : item.substr(eq + 1);

        if (name == "orderBy") {
            std::string_view target = unquote(arg);
            if (target == "$priority") {
                query.order_by_priority();
            } else if (target == "$key") {
                query.order_by_key();
            } else if (target == "$value") {
                throw unsupported_query("orderBy=\"$value\" is not supported");
            } else {
                query.order_by_child(std::string(target));
            }
        } else if (name == "limitToFirst") {
            query.limit_to_first(parse_limit(name, arg));
        } else if (name == "limitToLast") {
            query.limit_to_last(parse_limit(name, arg));
        } else if (name == "startAt" || name == "endAt" || name == "equalTo") {
            throw unsupported_query(std::string(name) + " is not supported");
        } else {
            throw unsupported_query("unknown query parameter '" + std::string(name) + "'");
        }
    }
    return query;
}

std::vector<DataSnapshot> Query::apply(const DataSnapshot& snapshot) const
{
    std::vector<DataSnapshot> children = snapshot.children();

    switch (order_) {
        case Order::Priority:
            break;
        case Order::Key:
            std::sort(children.begin(), children.end(),
                      [](const DataSnapshot& a, const DataSnapshot& b) { return a.key() < b.key(); });
            break;
        case Order::Child:
            std::sort(children.begin(), children.end(),
                      [this](const DataSnapshot& a, const DataSnapshot& b) {
                          const Value* va = a.value().find(order_child_);
                          const Value* vb = b.value().find(order_child_);
                          int c = compare_values(va ? *va : Value{}, vb ? *vb : Value{});
                          if (c != 0) return c < 0;
                          return a.key() < b.key();
                      });
            break;
    }

    if (limit_kind_ && children.size() > limit_) {
        if (*limit_kind_ == Limit::First) {
            children.erase(children.begin() + static_cast<std::ptrdiff_t>(limit_), children.end());
        } else {
            children.erase(children.begin(), children.end() - static_cast<std::ptrdiff_t>(limit_));
        }
    }
    return children;
}

} // namespace sync_tree
