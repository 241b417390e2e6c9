#include "core/entry.hpp"

#include <algorithm>

namespace lockbox {

Entry Entry::create(Timestamp now) {
    return Entry{
        .id = Uuid::generate(),
        .fields = {},
        .created_at = now,
        .updated_at = now,
        .location_changed_at = now,
        .history = {}
    };
}

std::optional<std::string_view> Entry::get_text(std::string_view key) const {
    const auto* value = fields.get(key);
    if (!value) return std::nullopt;
    return lockbox::get_text(*value);
}

void Entry::touch(Timestamp at) {
    if (at > updated_at) {
        updated_at = at;
    }
}

bool Entry::update_history() {
    if (!history.empty() && history.back().fields == fields) {
        return false;
    }
    return add_snapshot(snapshot());
}

bool Entry::add_snapshot(EntrySnapshot snapshot) {
    auto it = std::lower_bound(history.begin(), history.end(), snapshot.updated_at,
        [](const EntrySnapshot& s, Timestamp t) { return s.updated_at < t; });

    if (it != history.end() && it->updated_at == snapshot.updated_at) {
        return false;
    }

    history.insert(it, std::move(snapshot));
    return true;
}

} // namespace lockbox
