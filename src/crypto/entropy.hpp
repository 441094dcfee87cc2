#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <span>

namespace quid::crypto {

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * EntropySource - Supplier of cryptographically secure random bytes.
 *
 * Implementations must be safe to call concurrently. A failure is
 * reported once, through the returned Result, and never retried.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    // Fills every byte of `out` or fails with ErrorCode::EntropySource.
    virtual Result<void, Error> fill(std::span<uint8_t> out) = 0;
};

/**
 * Entropy from libsodium's randombytes_buf (getrandom(2) on Linux).
 */
class SodiumEntropySource final : public EntropySource {
public:
    Result<void, Error> fill(std::span<uint8_t> out) override;
};

// Process-wide libsodium source used by the generation overloads that
// take no explicit source.
[[nodiscard]] EntropySource& default_entropy();

} // namespace quid::crypto
