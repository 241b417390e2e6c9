#pragma once

#include "crypto/keys.hpp"
#include "core/result.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include <sodium.h>

namespace lockbox::crypto {

constexpr size_t SECRETBOX_NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t SECRETBOX_MAC_SIZE = crypto_secretbox_MACBYTES;

/**
 * Encrypt with XSalsa20-Poly1305.
 * Output layout: nonce || ciphertext || mac.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> encrypt_symmetric(
    std::span<const uint8_t> plaintext,
    const SymmetricKey& key
) {
    std::vector<uint8_t> output(SECRETBOX_NONCE_SIZE + plaintext.size() + SECRETBOX_MAC_SIZE);
    randombytes_buf(output.data(), SECRETBOX_NONCE_SIZE);

    int result = crypto_secretbox_easy(
        output.data() + SECRETBOX_NONCE_SIZE,
        plaintext.data(), plaintext.size(),
        output.data(),
        key.data()
    );

    if (result != 0) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Encryption failed", ErrorCode::Crypto});
    }

    return Result<std::vector<uint8_t>, Error>::ok(std::move(output));
}

/**
 * Decrypt data produced by encrypt_symmetric.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> decrypt_symmetric(
    std::span<const uint8_t> ciphertext,
    const SymmetricKey& key
) {
    if (ciphertext.size() < SECRETBOX_NONCE_SIZE + SECRETBOX_MAC_SIZE) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Ciphertext too short", ErrorCode::Crypto});
    }

    const uint8_t* nonce = ciphertext.data();
    const uint8_t* encrypted = ciphertext.data() + SECRETBOX_NONCE_SIZE;
    const size_t encrypted_len = ciphertext.size() - SECRETBOX_NONCE_SIZE;

    std::vector<uint8_t> plaintext(encrypted_len - SECRETBOX_MAC_SIZE);

    int result = crypto_secretbox_open_easy(
        plaintext.data(),
        encrypted, encrypted_len,
        nonce,
        key.data()
    );

    if (result != 0) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Decryption failed (invalid key or corrupted data)", ErrorCode::Crypto});
    }

    return Result<std::vector<uint8_t>, Error>::ok(std::move(plaintext));
}

} // namespace lockbox::crypto
