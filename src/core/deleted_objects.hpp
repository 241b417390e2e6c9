#pragma once

#include "core/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace lockbox {

/**
 * DeletedObject - Tombstone for a node that was deleted.
 */
struct DeletedObject {
    Uuid id;
    Timestamp deleted_at;

    bool operator==(const DeletedObject&) const = default;
};

/**
 * DeletedObjects - The tombstone ledger of a database.
 *
 * Holds at most one tombstone per identity, keeping the latest deletion time
 * seen. Tombstones are never removed: dropping one would let a stale replica
 * resurrect the node on its next merge.
 */
class DeletedObjects {
public:
    /**
     * Insert a tombstone, or raise an existing one's time to `deleted_at`.
     * Returns true if the ledger changed.
     */
    bool record(const Uuid& id, Timestamp deleted_at);

    [[nodiscard]] bool contains(const Uuid& id) const {
        return index_.contains(id);
    }

    [[nodiscard]] std::optional<Timestamp> timestamp_of(const Uuid& id) const;

    /**
     * Fold another ledger into this one, keeping per-identity maxima.
     */
    void merge_from(const DeletedObjects& other);

    /**
     * Tombstones in first-recorded order.
     */
    [[nodiscard]] const std::vector<DeletedObject>& objects() const noexcept {
        return objects_;
    }

    [[nodiscard]] size_t size() const noexcept { return objects_.size(); }
    [[nodiscard]] bool empty() const noexcept { return objects_.empty(); }

    bool operator==(const DeletedObjects& other) const {
        return objects_ == other.objects_;
    }

private:
    std::vector<DeletedObject> objects_;
    std::unordered_map<Uuid, size_t> index_;
};

} // namespace lockbox
