#pragma once

#include "core/types.hpp"
#include "core/value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox {

// Standard field names.
inline constexpr std::string_view TITLE_FIELD = "Title";
inline constexpr std::string_view USERNAME_FIELD = "UserName";
inline constexpr std::string_view PASSWORD_FIELD = "Password";
inline constexpr std::string_view URL_FIELD = "URL";
inline constexpr std::string_view NOTES_FIELD = "Notes";

/**
 * EntrySnapshot - A prior version of an entry kept in its history.
 */
struct EntrySnapshot {
    Timestamp updated_at;
    FieldMap fields;

    bool operator==(const EntrySnapshot&) const = default;
};

/**
 * Entry - A credential record.
 *
 * Invariant: updated_at is never older than any snapshot in history, and
 * history is ordered oldest first.
 */
struct Entry {
    Uuid id;
    FieldMap fields;
    Timestamp created_at;
    Timestamp updated_at;
    Timestamp location_changed_at;
    std::vector<EntrySnapshot> history;

    /**
     * Create an empty entry with a fresh identity.
     */
    [[nodiscard]] static Entry create(Timestamp now = Timestamp::now());

    [[nodiscard]] const Value* get(std::string_view key) const {
        return fields.get(key);
    }

    /**
     * Text of a plain or protected field, or nullopt if absent or binary.
     */
    [[nodiscard]] std::optional<std::string_view> get_text(std::string_view key) const;

    [[nodiscard]] std::optional<std::string_view> title() const { return get_text(TITLE_FIELD); }
    [[nodiscard]] std::optional<std::string_view> username() const { return get_text(USERNAME_FIELD); }
    [[nodiscard]] std::optional<std::string_view> password() const { return get_text(PASSWORD_FIELD); }

    void set(std::string_view key, Value value) {
        fields.set(key, std::move(value));
    }

    /**
     * Set the last-modified time. Never moves it backwards.
     */
    void touch(Timestamp at = Timestamp::now());

    /**
     * The current state as a history snapshot.
     */
    [[nodiscard]] EntrySnapshot snapshot() const {
        return EntrySnapshot{.updated_at = updated_at, .fields = fields};
    }

    /**
     * Push the current state onto history unless the newest snapshot already
     * holds the same fields. Returns true if a snapshot was added.
     */
    bool update_history();

    /**
     * Insert a snapshot keeping history ordered oldest first. A snapshot
     * whose timestamp is already present is dropped. Returns true if added.
     */
    bool add_snapshot(EntrySnapshot snapshot);

    bool operator==(const Entry&) const = default;
};

} // namespace lockbox
