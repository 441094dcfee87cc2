#pragma once

#include "core/result.hpp"
#include "core/timestamp.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quid {

/**
 * Version - The 4-bit scheme number stored in the high nibble of byte 6.
 */
class Version {
public:
    constexpr Version() noexcept = default;
    explicit constexpr Version(uint8_t value) noexcept : value_(value & 0x0F) {}

    [[nodiscard]] constexpr uint8_t value() const noexcept {
        return value_;
    }

    // Decimal rendering, "4" or "7" for the generated schemes.
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const Version&) const = default;
    bool operator==(const Version&) const = default;

private:
    uint8_t value_{0};
};

inline constexpr Version VERSION_RANDOM{4};
inline constexpr Version VERSION_TIME_ORDERED{7};

/**
 * UUID - Universally Unique Identifier.
 *
 * A 128-bit identifier stored inline as 16 bytes. Plain value type:
 * copies are independent and nothing is heap allocated.
 *
 * Binary layout:
 *   bytes 0-5   v7: big-endian millisecond Unix time, v4: random
 *   byte  6     high nibble: version
 *   byte  8     top two bits: variant (10)
 *
 * Text layout is the 36 character canonical form
 * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase on output and
 * case-insensitive on input.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    static constexpr size_t TEXT_SIZE = 36;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;
    using Text = std::array<char, TEXT_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    /**
     * Create a UUID from raw bytes.
     */
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static constexpr Uuid nil() noexcept {
        return Uuid{};
    }

    /**
     * Copy exactly 16 bytes into a new UUID. Any other length fails with
     * ErrorCode::InvalidLength.
     */
    [[nodiscard]] static Result<Uuid, Error> from_bytes(std::span<const uint8_t> data);

    /**
     * Parse the canonical 36 character text form.
     *
     * Errors, checked in this order:
     *   InvalidLength     input is not exactly 36 characters
     *   InvalidSeparator  a '-' is missing at index 8, 13, 18 or 23
     *   InvalidHex        a group holds a non-hex character
     *
     * Version and variant bits are not validated.
     */
    [[nodiscard]] static Result<Uuid, Error> parse(std::string_view text);

    /**
     * Like parse(), for text held in a byte buffer.
     */
    [[nodiscard]] static Result<Uuid, Error> parse_bytes(std::span<const uint8_t> text);

    // In-place decoders. The target is overwritten only on success and
    // keeps its previous value on failure.
    [[nodiscard]] Result<void, Error> assign_bytes(std::span<const uint8_t> data);
    [[nodiscard]] Result<void, Error> assign_text(std::string_view text);

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    // Independent copy of the 16 bytes.
    [[nodiscard]] constexpr Bytes to_bytes() const noexcept {
        return bytes_;
    }

    // The 36 canonical ASCII characters, without a terminator.
    [[nodiscard]] Text to_text() const;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr Version version() const noexcept {
        return Version(static_cast<uint8_t>(bytes_[6] >> 4));
    }

    /**
     * Creation time embedded in a version 7 UUID, or nullopt for every
     * other version.
     */
    [[nodiscard]] std::optional<Timestamp> timestamp() const noexcept;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    // Byte-wise; v7 UUIDs therefore order by their creation millisecond.
    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

inline constexpr Uuid NIL_UUID{};

/**
 * Canonical text of each UUID, in order.
 */
[[nodiscard]] std::vector<std::string> to_strings(std::span<const Uuid> ids);

} // namespace quid

namespace std {
    template<>
    struct hash<quid::Uuid> {
        size_t operator()(const quid::Uuid& uuid) const noexcept {
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
