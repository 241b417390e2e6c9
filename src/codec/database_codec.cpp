#include "codec/database_codec.hpp"

#include "core/logging.hpp"
#include "crypto/encryption.hpp"
#include "crypto/keys.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>

#include <algorithm>
#include <cstring>

namespace lockbox::codec {
namespace {

// ============================================================================
// JSON document
// ============================================================================

QString to_json_uuid(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

QJsonValue to_json_time(Timestamp ts) {
    return QJsonValue(static_cast<qint64>(ts.millis()));
}

QJsonArray to_json(const FieldMap& fields) {
    QJsonArray array;
    for (const auto& [key, value] : fields) {
        QJsonObject obj;
        obj["key"] = QString::fromStdString(key);
        obj["kind"] = QString::fromLatin1(kind_name(get_kind(value)).data());
        std::visit([&obj](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Binary>) {
                QByteArray raw(reinterpret_cast<const char*>(v.data.data()),
                               static_cast<qsizetype>(v.data.size()));
                obj["value"] = QString::fromLatin1(raw.toBase64());
            } else {
                obj["value"] = QString::fromStdString(v.text);
            }
        }, value);
        array.append(obj);
    }
    return array;
}

QJsonObject to_json(const Entry& entry) {
    QJsonObject obj;
    obj["type"] = QStringLiteral("entry");
    obj["uuid"] = to_json_uuid(entry.id);
    obj["fields"] = to_json(entry.fields);
    obj["created_at"] = to_json_time(entry.created_at);
    obj["updated_at"] = to_json_time(entry.updated_at);
    obj["location_changed_at"] = to_json_time(entry.location_changed_at);

    QJsonArray history;
    for (const auto& snapshot : entry.history) {
        QJsonObject snap;
        snap["updated_at"] = to_json_time(snapshot.updated_at);
        snap["fields"] = to_json(snapshot.fields);
        history.append(snap);
    }
    obj["history"] = history;
    return obj;
}

QJsonObject to_json(const Group& group) {
    QJsonObject obj;
    obj["type"] = QStringLiteral("group");
    obj["uuid"] = to_json_uuid(group.id);
    obj["name"] = QString::fromStdString(group.name);
    obj["notes"] = QString::fromStdString(group.notes);
    obj["created_at"] = to_json_time(group.created_at);
    obj["updated_at"] = to_json_time(group.updated_at);
    obj["location_changed_at"] = to_json_time(group.location_changed_at);

    QJsonArray children;
    for (const auto& child : group.children) {
        if (const auto* sub = child.as_group()) {
            children.append(to_json(*sub));
        } else {
            children.append(to_json(*child.as_entry()));
        }
    }
    obj["children"] = children;
    return obj;
}

QJsonObject to_json(const Database& db) {
    QJsonObject meta;
    meta["name"] = QString::fromStdString(db.meta.name);
    meta["description"] = QString::fromStdString(db.meta.description);
    meta["generator"] = QString::fromStdString(db.meta.generator);
    meta["name_changed_at"] = to_json_time(db.meta.name_changed_at);

    QJsonArray deleted;
    for (const auto& tombstone : db.deleted_objects.objects()) {
        QJsonObject obj;
        obj["uuid"] = to_json_uuid(tombstone.id);
        obj["deleted_at"] = to_json_time(tombstone.deleted_at);
        deleted.append(obj);
    }

    QJsonObject root;
    root["meta"] = meta;
    root["root"] = to_json(db.root);
    root["deleted_objects"] = deleted;
    return root;
}

Error decode_error(std::string message) {
    return Error{std::move(message), ErrorCode::Decode};
}

Result<Uuid, Error> parse_uuid(const QJsonObject& obj, const char* field) {
    auto id = Uuid::parse(obj[field].toString().toStdString());
    if (!id) {
        return Result<Uuid, Error>::err(decode_error(std::string("invalid ") + field));
    }
    return Result<Uuid, Error>::ok(*id);
}

Result<Timestamp, Error> parse_time(const QJsonObject& obj, const char* field) {
    const auto value = obj[field];
    if (!value.isDouble()) {
        return Result<Timestamp, Error>::err(decode_error(std::string("missing ") + field));
    }
    return Result<Timestamp, Error>::ok(Timestamp(value.toInteger()));
}

Result<FieldMap, Error> parse_fields(const QJsonValue& value) {
    if (!value.isArray()) {
        return Result<FieldMap, Error>::err(decode_error("fields must be an array"));
    }

    FieldMap fields;
    for (const auto& item : value.toArray()) {
        const auto obj = item.toObject();
        const auto key = obj["key"].toString().toStdString();
        const auto kind = parse_kind(obj["kind"].toString().toStdString());
        if (!kind) {
            return Result<FieldMap, Error>::err(decode_error("unknown value kind for field " + key));
        }
        if (fields.contains(key)) {
            return Result<FieldMap, Error>::err(decode_error("duplicate field " + key));
        }

        const auto text = obj["value"].toString();
        switch (*kind) {
            case ValueKind::Plain:
                fields.set(key, PlainText{text.toStdString()});
                break;
            case ValueKind::Protected:
                fields.set(key, ProtectedText{text.toStdString()});
                break;
            case ValueKind::Binary: {
                auto decoded = QByteArray::fromBase64Encoding(
                    text.toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
                if (!decoded) {
                    return Result<FieldMap, Error>::err(decode_error("invalid base64 in field " + key));
                }
                const auto& raw = *decoded;
                fields.set(key, Binary{std::vector<uint8_t>(raw.begin(), raw.end())});
                break;
            }
        }
    }

    return Result<FieldMap, Error>::ok(std::move(fields));
}

Result<Entry, Error> parse_entry(const QJsonObject& obj) {
    Entry entry;

    auto id = parse_uuid(obj, "uuid");
    if (id.is_err()) return Result<Entry, Error>::err(id.unwrap_err());
    entry.id = id.unwrap();

    auto fields = parse_fields(obj["fields"]);
    if (fields.is_err()) return Result<Entry, Error>::err(fields.unwrap_err());
    entry.fields = std::move(fields).unwrap();

    for (auto [field, target] : {std::pair{"created_at", &entry.created_at},
                                 std::pair{"updated_at", &entry.updated_at},
                                 std::pair{"location_changed_at", &entry.location_changed_at}}) {
        auto ts = parse_time(obj, field);
        if (ts.is_err()) return Result<Entry, Error>::err(ts.unwrap_err());
        *target = ts.unwrap();
    }

    for (const auto& item : obj["history"].toArray()) {
        const auto snap = item.toObject();
        auto ts = parse_time(snap, "updated_at");
        if (ts.is_err()) return Result<Entry, Error>::err(ts.unwrap_err());
        auto snap_fields = parse_fields(snap["fields"]);
        if (snap_fields.is_err()) return Result<Entry, Error>::err(snap_fields.unwrap_err());

        // History is kept strictly oldest first, never newer than the entry.
        const Timestamp at = ts.unwrap();
        if (!entry.history.empty() && at <= entry.history.back().updated_at) {
            return Result<Entry, Error>::err(
                decode_error("history of " + entry.id.to_string() + " is not in order"));
        }
        if (at > entry.updated_at) {
            return Result<Entry, Error>::err(
                decode_error("history of " + entry.id.to_string() + " is newer than the entry"));
        }

        entry.history.push_back(EntrySnapshot{
            .updated_at = at,
            .fields = std::move(snap_fields).unwrap()
        });
    }

    return Result<Entry, Error>::ok(std::move(entry));
}

Result<Group, Error> parse_group(const QJsonObject& obj) {
    Group group;

    auto id = parse_uuid(obj, "uuid");
    if (id.is_err()) return Result<Group, Error>::err(id.unwrap_err());
    group.id = id.unwrap();
    group.name = obj["name"].toString().toStdString();
    group.notes = obj["notes"].toString().toStdString();

    for (auto [field, target] : {std::pair{"created_at", &group.created_at},
                                 std::pair{"updated_at", &group.updated_at},
                                 std::pair{"location_changed_at", &group.location_changed_at}}) {
        auto ts = parse_time(obj, field);
        if (ts.is_err()) return Result<Group, Error>::err(ts.unwrap_err());
        *target = ts.unwrap();
    }

    for (const auto& item : obj["children"].toArray()) {
        const auto child = item.toObject();
        const auto type = child["type"].toString();
        if (type == QStringLiteral("group")) {
            auto sub = parse_group(child);
            if (sub.is_err()) return sub;
            group.add_child(std::move(sub).unwrap());
        } else if (type == QStringLiteral("entry")) {
            auto entry = parse_entry(child);
            if (entry.is_err()) return Result<Group, Error>::err(entry.unwrap_err());
            group.add_child(std::move(entry).unwrap());
        } else {
            return Result<Group, Error>::err(decode_error("unknown node type " + type.toStdString()));
        }
    }

    return Result<Group, Error>::ok(std::move(group));
}

Result<Database, Error> parse_database(const QJsonObject& obj, DatabaseConfig config) {
    Database db;
    db.config = config;

    const auto meta = obj["meta"].toObject();
    db.meta.name = meta["name"].toString().toStdString();
    db.meta.description = meta["description"].toString().toStdString();
    db.meta.generator = meta["generator"].toString().toStdString();
    auto name_changed = parse_time(meta, "name_changed_at");
    if (name_changed.is_err()) return Result<Database, Error>::err(name_changed.unwrap_err());
    db.meta.name_changed_at = name_changed.unwrap();

    auto root = parse_group(obj["root"].toObject());
    if (root.is_err()) return Result<Database, Error>::err(root.unwrap_err());
    db.root = std::move(root).unwrap();
    if (db.root.id != ROOT_GROUP_ID) {
        return Result<Database, Error>::err(
            decode_error("root group has identity " + db.root.id.to_string()));
    }

    for (const auto& item : obj["deleted_objects"].toArray()) {
        const auto tombstone = item.toObject();
        auto id = parse_uuid(tombstone, "uuid");
        if (id.is_err()) return Result<Database, Error>::err(id.unwrap_err());
        auto at = parse_time(tombstone, "deleted_at");
        if (at.is_err()) return Result<Database, Error>::err(at.unwrap_err());
        db.deleted_objects.record(id.unwrap(), at.unwrap());
    }

    if (auto dup = db.root.find_duplicate_id()) {
        return Result<Database, Error>::err(
            decode_error("identity " + dup->to_string() + " appears more than once"));
    }

    for (const auto& node : db.root.iter()) {
        if (node.id() != db.root.id && db.deleted_objects.contains(node.id())) {
            return Result<Database, Error>::err(
                decode_error("identity " + node.id().to_string() + " is both live and deleted"));
        }
    }

    return Result<Database, Error>::ok(std::move(db));
}

// ============================================================================
// Container header
// ============================================================================

template<typename T>
void put_le(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

template<typename T>
T get_le(const uint8_t* in) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(in[i]) << (8 * i);
    }
    return value;
}

} // namespace

Result<std::vector<uint8_t>, Error> encode(const Database& db, const DatabaseKey& key) {
    auto init = crypto::init();
    if (init.is_err()) {
        return Result<std::vector<uint8_t>, Error>::err(init.unwrap_err());
    }

    if (!db.config.kdf.within_bounds()) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"key derivation limits out of range", ErrorCode::Encode});
    }

    const auto salt = crypto::generate_salt();
    auto derived = crypto::derive_key_from_password(
        key.password, salt, db.config.kdf.ops_limit, db.config.kdf.mem_limit);
    if (derived.is_err()) {
        qCWarning(lockboxCodecLog) << "encode: key derivation failed";
        return Result<std::vector<uint8_t>, Error>::err(
            Error{derived.unwrap_err().message, ErrorCode::Encode});
    }
    auto symmetric_key = derived.unwrap();

    QByteArray document = QJsonDocument(to_json(db)).toJson(QJsonDocument::Compact);
    auto sealed = crypto::encrypt_symmetric(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(document.constData()),
                                 static_cast<size_t>(document.size())),
        symmetric_key);
    crypto::secure_zero(symmetric_key.data(), symmetric_key.size());
    crypto::secure_zero(document.data(), static_cast<size_t>(document.size()));

    if (sealed.is_err()) {
        qCWarning(lockboxCodecLog) << "encode: encryption failed";
        return Result<std::vector<uint8_t>, Error>::err(
            Error{sealed.unwrap_err().message, ErrorCode::Encode});
    }

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + sealed.unwrap().size());
    out.insert(out.end(), MAGIC.begin(), MAGIC.end());
    put_le<uint16_t>(out, FORMAT_VERSION);
    put_le<uint64_t>(out, db.config.kdf.ops_limit);
    put_le<uint64_t>(out, db.config.kdf.mem_limit);
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), sealed.unwrap().begin(), sealed.unwrap().end());

    qCDebug(lockboxCodecLog) << "encode: bytes=" << out.size();
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

Result<Database, Error> decode(std::span<const uint8_t> bytes, const DatabaseKey& key) {
    auto init = crypto::init();
    if (init.is_err()) {
        return Result<Database, Error>::err(init.unwrap_err());
    }

    if (bytes.size() < HEADER_SIZE) {
        return Result<Database, Error>::err(decode_error("container too short"));
    }
    if (!std::equal(MAGIC.begin(), MAGIC.end(), bytes.begin())) {
        return Result<Database, Error>::err(decode_error("not a lockbox container"));
    }

    const uint8_t* cursor = bytes.data() + MAGIC.size();
    const auto version = get_le<uint16_t>(cursor);
    cursor += 2;
    if (version != FORMAT_VERSION) {
        return Result<Database, Error>::err(
            decode_error("unsupported format version " + std::to_string(version)));
    }

    DatabaseConfig config;
    config.kdf.ops_limit = get_le<uint64_t>(cursor);
    cursor += 8;
    config.kdf.mem_limit = get_le<uint64_t>(cursor);
    cursor += 8;
    if (!config.kdf.within_bounds()) {
        qCWarning(lockboxCodecLog) << "decode: key derivation limits out of range"
                                   << config.kdf.ops_limit << config.kdf.mem_limit;
        return Result<Database, Error>::err(decode_error("key derivation limits out of range"));
    }

    crypto::Salt salt;
    std::memcpy(salt.data(), cursor, salt.size());

    auto derived = crypto::derive_key_from_password(
        key.password, salt, config.kdf.ops_limit, config.kdf.mem_limit);
    if (derived.is_err()) {
        return Result<Database, Error>::err(derived.unwrap_err());
    }
    auto symmetric_key = derived.unwrap();

    auto opened = crypto::decrypt_symmetric(bytes.subspan(HEADER_SIZE), symmetric_key);
    crypto::secure_zero(symmetric_key.data(), symmetric_key.size());
    if (opened.is_err()) {
        qCWarning(lockboxCodecLog) << "decode: authentication failed";
        return Result<Database, Error>::err(opened.unwrap_err());
    }

    auto& plaintext = opened.unwrap();
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(
        QByteArray(reinterpret_cast<const char*>(plaintext.data()),
                   static_cast<qsizetype>(plaintext.size())),
        &parse_error);
    crypto::secure_zero(plaintext.data(), plaintext.size());

    if (doc.isNull() || !doc.isObject()) {
        qCWarning(lockboxCodecLog) << "decode: invalid document:" << parse_error.errorString();
        return Result<Database, Error>::err(
            decode_error("invalid document: " + parse_error.errorString().toStdString()));
    }

    auto db = parse_database(doc.object(), config);
    if (db.is_err()) {
        qCWarning(lockboxCodecLog) << "decode:" << QString::fromStdString(db.unwrap_err().message);
    }
    return db;
}

} // namespace lockbox::codec
