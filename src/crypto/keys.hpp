#pragma once

#include "core/result.hpp"

#include <array>
#include <cstdint>
#include <string_view>

#include <sodium.h>

namespace lockbox::crypto {

constexpr size_t SYMMETRIC_KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t SALT_SIZE = crypto_pwhash_SALTBYTES;

using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;
using Salt = std::array<uint8_t, SALT_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium", ErrorCode::Crypto});
    }
    return Result<void, Error>::ok();
}

/**
 * Derive a symmetric key from a password with Argon2id.
 */
[[nodiscard]] inline Result<SymmetricKey, Error> derive_key_from_password(
    std::string_view password,
    const Salt& salt,
    uint64_t ops_limit,
    uint64_t mem_limit
) {
    if (ops_limit < crypto_pwhash_OPSLIMIT_MIN || ops_limit > crypto_pwhash_OPSLIMIT_MAX ||
        mem_limit < crypto_pwhash_MEMLIMIT_MIN || mem_limit > crypto_pwhash_MEMLIMIT_MAX) {
        return Result<SymmetricKey, Error>::err(
            Error{"Key derivation limits out of range", ErrorCode::Crypto});
    }

    SymmetricKey key;
    int result = crypto_pwhash(
        key.data(), key.size(),
        password.data(), password.size(),
        salt.data(),
        ops_limit,
        static_cast<size_t>(mem_limit),
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0) {
        return Result<SymmetricKey, Error>::err(Error{"Key derivation failed", ErrorCode::Crypto});
    }

    return Result<SymmetricKey, Error>::ok(key);
}

[[nodiscard]] inline Salt generate_salt() {
    Salt salt;
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

/**
 * Securely zero memory.
 */
inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

} // namespace lockbox::crypto
