#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lockbox {

/**
 * Field value kinds. Protected text compares and merges like plain text;
 * the flag only tells encoders and UIs to treat it as confidential.
 */
struct PlainText {
    std::string text;

    bool operator==(const PlainText&) const = default;
};

struct ProtectedText {
    std::string text;

    bool operator==(const ProtectedText&) const = default;
};

struct Binary {
    std::vector<uint8_t> data;

    bool operator==(const Binary&) const = default;
};

using Value = std::variant<PlainText, ProtectedText, Binary>;

enum class ValueKind {
    Plain,
    Protected,
    Binary
};

[[nodiscard]] constexpr ValueKind get_kind(const Value& value) {
    return std::visit([](const auto& v) -> ValueKind {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, PlainText>) return ValueKind::Plain;
        else if constexpr (std::is_same_v<T, ProtectedText>) return ValueKind::Protected;
        else return ValueKind::Binary;
    }, value);
}

[[nodiscard]] constexpr std::string_view kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Plain: return "plain";
        case ValueKind::Protected: return "protected";
        case ValueKind::Binary: return "binary";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ValueKind> parse_kind(std::string_view name) {
    if (name == "plain") return ValueKind::Plain;
    if (name == "protected") return ValueKind::Protected;
    if (name == "binary") return ValueKind::Binary;
    return std::nullopt;
}

/**
 * Text of a plain or protected value; nullopt for binary data.
 */
[[nodiscard]] inline std::optional<std::string_view> get_text(const Value& value) {
    if (auto* plain = std::get_if<PlainText>(&value)) return plain->text;
    if (auto* secret = std::get_if<ProtectedText>(&value)) return secret->text;
    return std::nullopt;
}

/**
 * FieldMap - Entry fields keyed by name.
 *
 * Keys are unique. Iteration follows insertion order so that encode/decode
 * reproduces the layout a user saw; equality ignores order.
 */
class FieldMap {
public:
    using Field = std::pair<std::string, Value>;
    using const_iterator = std::vector<Field>::const_iterator;

    FieldMap() = default;
    FieldMap(std::initializer_list<Field> fields) {
        for (const auto& [key, value] : fields) {
            set(key, value);
        }
    }

    [[nodiscard]] const Value* get(std::string_view key) const {
        auto it = find(key);
        return it == fields_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return find(key) != fields_.end();
    }

    /**
     * Insert or overwrite. An existing key keeps its position.
     */
    void set(std::string_view key, Value value) {
        auto it = std::find_if(fields_.begin(), fields_.end(),
            [&](const Field& f) { return f.first == key; });
        if (it != fields_.end()) {
            it->second = std::move(value);
        } else {
            fields_.emplace_back(std::string(key), std::move(value));
        }
    }

    bool remove(std::string_view key) {
        auto it = find(key);
        if (it == fields_.end()) return false;
        fields_.erase(it);
        return true;
    }

    [[nodiscard]] size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    bool operator==(const FieldMap& other) const {
        if (fields_.size() != other.fields_.size()) return false;
        for (const auto& [key, value] : fields_) {
            const auto* theirs = other.get(key);
            if (!theirs || *theirs != value) return false;
        }
        return true;
    }

private:
    [[nodiscard]] const_iterator find(std::string_view key) const {
        return std::find_if(fields_.begin(), fields_.end(),
            [&](const Field& f) { return f.first == key; });
    }

    std::vector<Field> fields_;
};

} // namespace lockbox
