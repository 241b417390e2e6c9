#include "core/merge.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <utility>

namespace lockbox {

size_t MergeLog::count(MergeEventType type) const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [type](const MergeEvent& e) { return e.type == type; }));
}

bool MergeLog::contains(MergeEventType type, const Uuid& id) const {
    return std::find(events.begin(), events.end(), MergeEvent{type, id}) != events.end();
}

namespace {

Error kind_conflict(const Uuid& id, NodeKind local, NodeKind incoming) {
    return Error{
        "node " + id.to_string() + " is a " + std::string(kind_name(local)) +
        " locally but a " + std::string(kind_name(incoming)) + " in the incoming database",
        ErrorCode::KindConflict};
}

/**
 * A group without its children, used when an unknown incoming group is
 * inserted. Its children are merged one by one afterwards, so nodes that
 * already exist elsewhere locally are relocated instead of duplicated.
 */
Group shallow_copy(const Group& group) {
    return Group{
        .id = group.id,
        .name = group.name,
        .notes = group.notes,
        .created_at = group.created_at,
        .updated_at = group.updated_at,
        .location_changed_at = group.location_changed_at,
        .children = {}
    };
}

class Merger {
public:
    Merger(Database& work, const Database& incoming)
        : work_(work), incoming_(incoming) {}

    Result<void, Error> run() {
        auto validated = validate_inputs();
        if (validated.is_err()) return validated;

        apply_tombstones();
        merge_meta();

        auto merged = merge_tree();
        if (merged.is_err()) return merged;

        return validate_result();
    }

    MergeLog take_log() { return std::move(log_); }

private:
    Result<void, Error> validate_inputs() const {
        if (auto dup = work_.root.find_duplicate_id()) {
            return Result<void, Error>::err(Error{
                "local database contains " + dup->to_string() + " more than once",
                ErrorCode::PreconditionViolation});
        }
        if (auto dup = incoming_.root.find_duplicate_id()) {
            return Result<void, Error>::err(Error{
                "incoming database contains " + dup->to_string() + " more than once",
                ErrorCode::PreconditionViolation});
        }
        return Result<void, Error>::ok();
    }

    // Runs before the structural pass so that an update processed later in
    // this merge cannot re-add a node deleted on the other side.
    void apply_tombstones() {
        for (const auto& tombstone : incoming_.deleted_objects.objects()) {
            auto local_time = work_.deleted_objects.timestamp_of(tombstone.id);
            if (local_time && *local_time >= tombstone.deleted_at) {
                continue;
            }

            if (tombstone.id == work_.root.id) {
                warn("ignoring tombstone for the root group " + tombstone.id.to_string());
                continue;
            }

            auto removed = work_.delete_by_id(tombstone.id, true, tombstone.deleted_at);
            if (removed) {
                record(removed->is_group() ? MergeEventType::GroupDeleted
                                           : MergeEventType::EntryDeleted,
                       tombstone.id);
            } else {
                work_.deleted_objects.record(tombstone.id, tombstone.deleted_at);
            }
        }
    }

    void merge_meta() {
        if (incoming_.meta.name_changed_at > work_.meta.name_changed_at) {
            work_.meta.name = incoming_.meta.name;
            work_.meta.description = incoming_.meta.description;
            work_.meta.name_changed_at = incoming_.meta.name_changed_at;
        }

        if (merge_group_content(work_.root, incoming_.root)) {
            record(MergeEventType::GroupUpdated, work_.root.id);
        }
    }

    Result<void, Error> merge_tree() {
        struct Pending {
            const Group* incoming;
            Uuid counterpart;
        };

        // The roots correspond to each other whatever their identities.
        std::vector<Pending> stack{{&incoming_.root, work_.root.id}};

        while (!stack.empty()) {
            const Pending pending = stack.back();
            stack.pop_back();

            std::vector<Pending> subgroups;
            for (const Node& child : pending.incoming->children) {
                auto merged = merge_child(child, pending.counterpart);
                if (merged.is_err()) {
                    return Result<void, Error>::err(merged.unwrap_err());
                }
                if (merged.unwrap()) {
                    subgroups.push_back({child.as_group(), child.id()});
                }
            }

            stack.insert(stack.end(), subgroups.rbegin(), subgroups.rend());
        }

        return Result<void, Error>::ok();
    }

    /**
     * Merge one incoming child under the local group `parent_id`. Returns
     * true when the child is a group whose children must be merged next.
     */
    Result<bool, Error> merge_child(const Node& child, const Uuid& parent_id) {
        const Uuid& id = child.id();

        if (work_.deleted_objects.contains(id)) {
            qCDebug(lockboxMergeLog) << "skip tombstoned" << to_qstring(id);
            return Result<bool, Error>::ok(false);
        }

        if (id == work_.root.id) {
            return Result<bool, Error>::err(Error{
                "root group " + id.to_string() + " appears as a child",
                ErrorCode::StructuralInconsistency});
        }

        auto path = work_.root.locate(id);
        if (!path) {
            return insert_new(child, parent_id);
        }

        Node* local = work_.root.resolve(*path);
        if (!local) {
            return Result<bool, Error>::err(Error{
                "path to " + id.to_string() + " does not resolve",
                ErrorCode::StructuralInconsistency});
        }
        if (local->kind() != child.kind()) {
            return Result<bool, Error>::err(kind_conflict(id, local->kind(), child.kind()));
        }

        if (auto* entry = local->as_entry()) {
            if (merge_entry(*entry, *child.as_entry())) {
                record(MergeEventType::EntryUpdated, id);
            }
        } else if (merge_group_content(*local->as_group(), *child.as_group())) {
            record(MergeEventType::GroupUpdated, id);
        }

        auto relocated = relocate(*path, *local, child, parent_id);
        if (relocated.is_err()) {
            return Result<bool, Error>::err(relocated.unwrap_err());
        }

        return Result<bool, Error>::ok(child.is_group());
    }

    Result<bool, Error> insert_new(const Node& child, const Uuid& parent_id) {
        auto* parent = work_.root.find_group(parent_id);
        if (!parent) {
            return Result<bool, Error>::err(Error{
                "parent " + parent_id.to_string() + " of " + child.id().to_string() +
                " is not a local group",
                ErrorCode::StructuralInconsistency});
        }

        if (const auto* entry = child.as_entry()) {
            parent->add_child(*entry);
            record(MergeEventType::EntryCreated, child.id());
            return Result<bool, Error>::ok(false);
        }

        parent->add_child(shallow_copy(*child.as_group()));
        record(MergeEventType::GroupCreated, child.id());
        return Result<bool, Error>::ok(true);
    }

    Result<void, Error> relocate(const NodePath& path, Node& local,
                                 const Node& incoming, const Uuid& parent_id) {
        NodePath parent_path(path.begin(), path.end() - 1);
        const auto* current_parent = work_.root.resolve_group(parent_path);
        if (!current_parent) {
            return Result<void, Error>::err(Error{
                "parent of " + incoming.id().to_string() + " does not resolve",
                ErrorCode::StructuralInconsistency});
        }

        if (incoming.location_changed_at() <= local.location_changed_at()) {
            return Result<void, Error>::ok();
        }
        if (current_parent->id == parent_id) {
            // Moved away and back on the other side: same place, newer stamp.
            local.set_location_changed_at(incoming.location_changed_at());
            return Result<void, Error>::ok();
        }

        const Uuid id = incoming.id();
        const bool is_group = incoming.is_group();
        auto moved = work_.move_node(id, parent_id, incoming.location_changed_at());
        if (moved.is_err()) {
            const auto& error = moved.unwrap_err();
            if (error.code == ErrorCode::PreconditionViolation) {
                warn("kept " + id.to_string() + " in place: " + error.message);
                return Result<void, Error>::ok();
            }
            return moved;
        }

        record(is_group ? MergeEventType::GroupLocationUpdated
                        : MergeEventType::EntryLocationUpdated,
               id);
        return Result<void, Error>::ok();
    }

    /**
     * Returns true if the local entry changed.
     */
    bool merge_entry(Entry& local, const Entry& incoming) {
        bool changed = false;

        for (const auto& snapshot : incoming.history) {
            changed |= local.add_snapshot(snapshot);
        }

        if (incoming.updated_at > local.updated_at) {
            if (local.fields != incoming.fields) {
                local.add_snapshot(local.snapshot());
            }
            local.fields = incoming.fields;
            local.updated_at = incoming.updated_at;
            changed = true;
        } else if (incoming.updated_at < local.updated_at) {
            if (local.fields != incoming.fields) {
                changed |= local.add_snapshot(incoming.snapshot());
            }
        } else if (local.fields != incoming.fields) {
            warn("entry " + local.id.to_string() +
                 " differs at an identical timestamp; kept local content");
        }

        return changed;
    }

    /**
     * Name and notes follow the newer side. Returns true if local changed.
     */
    bool merge_group_content(Group& local, const Group& incoming) {
        if (incoming.updated_at < local.updated_at) {
            return false;
        }
        if (incoming.updated_at == local.updated_at) {
            if (incoming.name != local.name || incoming.notes != local.notes) {
                warn("group " + local.id.to_string() +
                     " differs at an identical timestamp; kept local name and notes");
            }
            return false;
        }
        local.name = incoming.name;
        local.notes = incoming.notes;
        local.updated_at = incoming.updated_at;
        return true;
    }

    Result<void, Error> validate_result() const {
        if (auto dup = work_.root.find_duplicate_id()) {
            return Result<void, Error>::err(Error{
                "merge would duplicate " + dup->to_string(),
                ErrorCode::StructuralInconsistency});
        }

        for (const auto& node : work_.root.iter()) {
            if (node.id() != work_.root.id && work_.deleted_objects.contains(node.id())) {
                return Result<void, Error>::err(Error{
                    "node " + node.id().to_string() + " is both live and tombstoned",
                    ErrorCode::StructuralInconsistency});
            }
        }

        return Result<void, Error>::ok();
    }

    void record(MergeEventType type, const Uuid& id) {
        qCDebug(lockboxMergeLog) << event_name(type).data() << to_qstring(id);
        log_.events.push_back(MergeEvent{type, id});
    }

    void warn(std::string message) {
        qCWarning(lockboxMergeLog) << QString::fromStdString(message);
        log_.warnings.push_back(std::move(message));
    }

    Database& work_;
    const Database& incoming_;
    MergeLog log_;
};

} // namespace

Result<MergeLog, Error> merge(Database& local, const Database& incoming) {
    Database work = local;
    Merger merger(work, incoming);

    auto result = merger.run();
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        qCWarning(lockboxMergeLog) << "merge aborted:" << error_code_name(error.code).data()
                                   << QString::fromStdString(error.message);
        return Result<MergeLog, Error>::err(error);
    }

    local = std::move(work);

    auto log = merger.take_log();
    qCInfo(lockboxMergeLog) << "merge complete: events=" << log.events.size()
                            << "warnings=" << log.warnings.size();
    return Result<MergeLog, Error>::ok(std::move(log));
}

} // namespace lockbox
