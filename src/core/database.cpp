#include "core/database.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace lockbox {

Database Database::create(DatabaseConfig config, Timestamp now) {
    Database db;
    db.config = config;
    db.meta.name_changed_at = now;
    db.root = Group::root("Root", now);
    return db;
}

std::optional<Node> Database::delete_by_id(const Uuid& id, bool log_deletion, Timestamp deleted_at) {
    auto path = root.locate(id);
    if (!path || path->empty()) {
        qCDebug(lockboxTreeLog) << "delete: no deletable node" << to_qstring(id);
        return std::nullopt;
    }

    auto removed = root.detach(*path);
    if (!removed) {
        return std::nullopt;
    }

    if (log_deletion) {
        deleted_objects.record(id, deleted_at);
    }

    qCDebug(lockboxTreeLog) << "delete:" << kind_name(removed->kind()).data() << to_qstring(id)
                            << "logged=" << log_deletion;
    return removed;
}

Result<void, Error> Database::move_node(const Uuid& id, const Uuid& new_parent_id, Timestamp at) {
    auto path = root.locate(id);
    if (!path) {
        return Result<void, Error>::err(
            Error{"no node " + id.to_string(), ErrorCode::NotFound});
    }
    if (path->empty()) {
        return Result<void, Error>::err(
            Error{"the root group cannot be moved", ErrorCode::PreconditionViolation});
    }

    auto target_path = root.locate(new_parent_id);
    if (!target_path) {
        return Result<void, Error>::err(
            Error{"no group " + new_parent_id.to_string(), ErrorCode::NotFound});
    }
    if (!root.resolve_group(*target_path)) {
        return Result<void, Error>::err(
            Error{new_parent_id.to_string() + " is not a group", ErrorCode::PreconditionViolation});
    }
    if (target_path->size() >= path->size() &&
        std::equal(path->begin(), path->end(), target_path->begin())) {
        return Result<void, Error>::err(
            Error{"cannot move " + id.to_string() + " into its own subtree",
                  ErrorCode::PreconditionViolation});
    }

    auto node = root.detach(*path);
    if (!node) {
        return Result<void, Error>::err(
            Error{"failed to detach " + id.to_string(), ErrorCode::StructuralInconsistency});
    }

    // Detaching shifted siblings, so the target is looked up again.
    auto* target = root.find_group(new_parent_id);
    if (!target) {
        return Result<void, Error>::err(
            Error{"lost target group " + new_parent_id.to_string(), ErrorCode::StructuralInconsistency});
    }

    node->set_location_changed_at(at);
    target->add_child(std::move(*node));

    qCDebug(lockboxTreeLog) << "move:" << to_qstring(id) << "->" << to_qstring(new_parent_id);
    return Result<void, Error>::ok();
}

std::optional<Uuid> Database::parent_of(const Uuid& id) const {
    auto path = root.locate(id);
    if (!path || path->empty()) return std::nullopt;

    NodePath parent_path(path->begin(), path->end() - 1);
    const auto* parent = root.resolve_group(parent_path);
    if (!parent) return std::nullopt;
    return parent->id;
}

} // namespace lockbox
