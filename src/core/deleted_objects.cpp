#include "core/deleted_objects.hpp"

namespace lockbox {

bool DeletedObjects::record(const Uuid& id, Timestamp deleted_at) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        index_.emplace(id, objects_.size());
        objects_.push_back(DeletedObject{.id = id, .deleted_at = deleted_at});
        return true;
    }

    auto& existing = objects_[it->second];
    if (deleted_at > existing.deleted_at) {
        existing.deleted_at = deleted_at;
        return true;
    }
    return false;
}

std::optional<Timestamp> DeletedObjects::timestamp_of(const Uuid& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return objects_[it->second].deleted_at;
}

void DeletedObjects::merge_from(const DeletedObjects& other) {
    for (const auto& object : other.objects_) {
        record(object.id, object.deleted_at);
    }
}

} // namespace lockbox
