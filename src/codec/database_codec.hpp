#pragma once

#include "core/database.hpp"
#include "core/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace lockbox::codec {

/**
 * Container layout (integers little-endian):
 *
 *   magic "LBOX" | version u16 | ops_limit u64 | mem_limit u64 | salt[16]
 *   | nonce[24] | secretbox(JSON document)
 */
constexpr std::array<uint8_t, 4> MAGIC = {'L', 'B', 'O', 'X'};
constexpr uint16_t FORMAT_VERSION = 1;
constexpr size_t HEADER_SIZE = 4 + 2 + 8 + 8 + 16;

/**
 * DatabaseKey - Credentials protecting an encoded database.
 */
struct DatabaseKey {
    std::string password;

    [[nodiscard]] static DatabaseKey with_password(std::string password) {
        return DatabaseKey{.password = std::move(password)};
    }
};

/**
 * Serialize and encrypt a database. Every field, history snapshot and
 * tombstone is preserved.
 */
[[nodiscard]] Result<std::vector<uint8_t>, Error> encode(const Database& db, const DatabaseKey& key);

/**
 * Decrypt and parse bytes produced by encode. A wrong key or tampered
 * ciphertext yields ErrorCode::Crypto; a malformed container or document
 * yields ErrorCode::Decode.
 */
[[nodiscard]] Result<Database, Error> decode(std::span<const uint8_t> bytes, const DatabaseKey& key);

} // namespace lockbox::codec
