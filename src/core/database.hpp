#pragma once

#include "core/deleted_objects.hpp"
#include "core/group.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <sodium.h>

namespace lockbox {

/**
 * KdfConfig - Argon2id limits used to turn a password into a key.
 */
struct KdfConfig {
    uint64_t ops_limit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    uint64_t mem_limit = crypto_pwhash_MEMLIMIT_INTERACTIVE;

    /**
     * Smallest limits libsodium accepts. Only suitable for tests.
     */
    [[nodiscard]] static KdfConfig minimal() {
        return KdfConfig{
            .ops_limit = crypto_pwhash_OPSLIMIT_MIN,
            .mem_limit = crypto_pwhash_MEMLIMIT_MIN
        };
    }

    /**
     * True when libsodium accepts the limits and neither exceeds its
     * SENSITIVE preset. Containers outside these bounds are rejected.
     */
    [[nodiscard]] bool within_bounds() const noexcept {
        return ops_limit >= crypto_pwhash_OPSLIMIT_MIN &&
               ops_limit <= crypto_pwhash_OPSLIMIT_SENSITIVE &&
               mem_limit >= crypto_pwhash_MEMLIMIT_MIN &&
               mem_limit <= crypto_pwhash_MEMLIMIT_SENSITIVE;
    }

    bool operator==(const KdfConfig&) const = default;
};

struct DatabaseConfig {
    KdfConfig kdf;

    bool operator==(const DatabaseConfig&) const = default;
};

/**
 * Meta - Database-level metadata.
 */
struct Meta {
    std::string name;
    std::string description;
    std::string generator{"lockbox"};
    Timestamp name_changed_at;

    bool operator==(const Meta&) const = default;
};

/**
 * Database - A tree of groups and entries plus its tombstone ledger.
 *
 * Not internally synchronized: callers hold exclusive access while mutating,
 * traversing or merging a database.
 */
struct Database {
    DatabaseConfig config;
    Meta meta;
    Group root;
    DeletedObjects deleted_objects;

    /**
     * Create an empty database whose root carries ROOT_GROUP_ID.
     */
    [[nodiscard]] static Database create(DatabaseConfig config = {}, Timestamp now = Timestamp::now());

    /**
     * Remove the node with `id`, and its whole subtree, from the tree.
     *
     * With log_deletion a tombstone for `id` alone is recorded at
     * `deleted_at`; descendants of a removed group are not tombstoned
     * individually. The root cannot be deleted. Returns the removed node,
     * or nullopt (ledger untouched) when nothing matched.
     */
    std::optional<Node> delete_by_id(const Uuid& id, bool log_deletion, Timestamp deleted_at);

    std::optional<Node> delete_by_id(const Uuid& id, bool log_deletion) {
        return delete_by_id(id, log_deletion, Timestamp::now());
    }

    /**
     * Move a node under another group, appending it after the existing
     * children and stamping location_changed_at.
     */
    [[nodiscard]] Result<void, Error> move_node(const Uuid& id, const Uuid& new_parent_id,
                                                Timestamp at = Timestamp::now());

    /**
     * Identity of the group that directly contains `id`.
     */
    [[nodiscard]] std::optional<Uuid> parent_of(const Uuid& id) const;

    bool operator==(const Database&) const = default;
};

} // namespace lockbox
