#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <sodium.h>

namespace lockbox {

/**
 * Uuid - Permanent identity of a node.
 *
 * A 128-bit value assigned once when a group or entry is created and carried
 * unchanged through encode/decode and merges. Equality of two nodes across
 * replicas is decided by this value alone.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4) from the libsodium CSPRNG.
     */
    [[nodiscard]] static Uuid generate() {
        Bytes bytes;
        randombytes_buf(bytes.data(), bytes.size());

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Parse a UUID from its textual form, hyphens optional.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        Bytes bytes{};
        size_t nibble = 0;

        for (char c : str) {
            if (c == '-') continue;
            if (nibble >= BYTE_SIZE * 2) return std::nullopt;

            int value = hex_value(c);
            if (value < 0) return std::nullopt;

            auto& byte = bytes[nibble / 2];
            byte = static_cast<uint8_t>((nibble % 2 == 0) ? (value << 4) : (byte | value));
            ++nibble;
        }

        if (nibble != BYTE_SIZE * 2) return std::nullopt;
        return Uuid(bytes);
    }

    /**
     * Hyphenated, lowercase: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');

        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - Milliseconds since the Unix epoch.
 *
 * Used for last-modified, location-changed and deletion times. Merge
 * decisions compare these values directly, so replicas are expected to have
 * roughly synchronized clocks.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * Format as ISO 8601 (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        // Floor division so that times before the epoch keep a 0..999 fraction.
        int64_t seconds = millis_ / 1000;
        int64_t fraction = millis_ % 1000;
        if (fraction < 0) {
            fraction += 1000;
            --seconds;
        }

        auto time_t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&time_t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << fraction << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

/**
 * Well-known identity of every database's root group. The root is matched
 * positionally during merges and can never be deleted.
 */
inline constexpr Uuid ROOT_GROUP_ID{Uuid::Bytes{
    0x6c, 0x6f, 0x63, 0x6b, 0x62, 0x6f, 0x78, 0x00,
    0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01}};

} // namespace lockbox

namespace std {
    template<>
    struct hash<lockbox::Uuid> {
        size_t operator()(const lockbox::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
