#pragma once

#include "core/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lockbox {

enum class MergeEventType {
    EntryCreated,
    EntryUpdated,
    EntryDeleted,
    EntryLocationUpdated,
    GroupCreated,
    GroupUpdated,
    GroupDeleted,
    GroupLocationUpdated
};

[[nodiscard]] constexpr std::string_view event_name(MergeEventType type) {
    switch (type) {
        case MergeEventType::EntryCreated: return "entry_created";
        case MergeEventType::EntryUpdated: return "entry_updated";
        case MergeEventType::EntryDeleted: return "entry_deleted";
        case MergeEventType::EntryLocationUpdated: return "entry_location_updated";
        case MergeEventType::GroupCreated: return "group_created";
        case MergeEventType::GroupUpdated: return "group_updated";
        case MergeEventType::GroupDeleted: return "group_deleted";
        case MergeEventType::GroupLocationUpdated: return "group_location_updated";
    }
    return "unknown";
}

struct MergeEvent {
    MergeEventType type;
    Uuid node_id;

    bool operator==(const MergeEvent&) const = default;
};

/**
 * MergeLog - What a successful merge changed in the local database.
 */
struct MergeLog {
    std::vector<MergeEvent> events;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_changes() const noexcept { return !events.empty(); }

    [[nodiscard]] size_t count(MergeEventType type) const;

    [[nodiscard]] bool contains(MergeEventType type, const Uuid& id) const;
};

/**
 * Reconcile `incoming` into `local`.
 *
 * 1. Incoming tombstones newer than local ones delete the matching local
 *    node and are added to the local ledger.
 * 2. The incoming tree is walked top-down. Tombstoned identities are skipped
 *    together with their subtrees, whatever their timestamps. Unknown nodes
 *    are appended under their parent's local counterpart. Known nodes take
 *    the content of the strictly newer side (ties keep local); for entries
 *    the losing content is kept as a history snapshot and both histories
 *    are unioned. A node found under different parents follows the side
 *    with the later location change.
 * 3. The result is validated and only then replaces `local`.
 *
 * On error (KindConflict, StructuralInconsistency, PreconditionViolation)
 * `local` is left untouched. `incoming` is only read and may be `local`
 * itself.
 */
[[nodiscard]] Result<MergeLog, Error> merge(Database& local, const Database& incoming);

} // namespace lockbox
