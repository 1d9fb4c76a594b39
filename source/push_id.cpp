// push_id.cpp - PushIdGenerator implementation

#include <sync_tree/push_id.h>

#include <chrono>

namespace sync_tree {

PushIdGenerator::PushIdGenerator()
    : PushIdGenerator(&PushIdGenerator::system_clock_ms)
{
}

PushIdGenerator::PushIdGenerator(Clock clock)
    : clock_(std::move(clock))
    , rng_(std::random_device{}())
{
}

std::int64_t PushIdGenerator::system_clock_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string PushIdGenerator::next()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::int64_t now = clock_();

    if (now > last_time_) {
        last_time_ = now;
        std::uniform_int_distribution<int> dist(0, 63);
        for (auto& digit : last_random_) {
            digit = static_cast<std::uint8_t>(dist(rng_));
        }
    } else {
        // Same millisecond or clock went backwards: increment the suffix
        std::size_t i = random_chars;
        while (i > 0 && last_random_[i - 1] == 63) {
            last_random_[i - 1] = 0;
            --i;
        }
        if (i > 0) {
            ++last_random_[i - 1];
        } else {
            ++last_time_;
        }
    }

    std::string id(push_id_length, '-');
    std::int64_t t = last_time_;
    for (std::size_t i = timestamp_chars; i > 0; --i) {
        id[i - 1] = push_id_alphabet[static_cast<std::size_t>(t % 64)];
        t /= 64;
    }
    for (std::size_t i = 0; i < random_chars; ++i) {
        id[timestamp_chars + i] = push_id_alphabet[last_random_[i]];
    }
    return id;
}

std::optional<std::int64_t> push_id_timestamp(std::string_view key)
{
    if (key.size() != push_id_length) {
        return std::nullopt;
    }
    std::int64_t t = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        auto pos = push_id_alphabet.find(key[i]);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        t = t * 64 + static_cast<std::int64_t>(pos);
    }
    return t;
}

} // namespace sync_tree
