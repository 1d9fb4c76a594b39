// snapshot.cpp - DataSnapshot implementation

#include <sync_tree/snapshot.h>
#include <sync_tree/path_core.h>
#include <sync_tree/priority.h>
#include <sync_tree/serialization.h>

namespace sync_tree {

DataSnapshot::DataSnapshot(Path path)
    : path_(std::move(path))
{
}

DataSnapshot::DataSnapshot(Path path, std::optional<Value> value)
    : path_(std::move(path))
    , value_(value ? std::move(*value) : Value{})
    , exists_(value.has_value())
{
}

DataSnapshot DataSnapshot::child(std::string_view relative) const
{
    Path sub = Path::from_string(relative);
    Path full = path_;
    for (const auto& segment : sub) {
        full = full.child(segment);
    }
    if (!exists_) {
        return DataSnapshot{std::move(full)};
    }
    return DataSnapshot{std::move(full), get_at_path(value_, sub)};
}

bool DataSnapshot::has_child(std::string_view relative) const
{
    return exists_ && get_at_path(value_, Path::from_string(relative)).has_value();
}

std::vector<DataSnapshot> DataSnapshot::children() const
{
    std::vector<DataSnapshot> result;
    for (auto& [key, val] : ordered_children(value_)) {
        result.emplace_back(path_.child(key), std::move(val));
    }
    return result;
}

std::string DataSnapshot::to_json(bool compact) const
{
    return sync_tree::to_json(value_, compact);
}

} // namespace sync_tree
