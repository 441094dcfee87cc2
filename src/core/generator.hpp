#pragma once

#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "core/uuid.hpp"
#include "crypto/entropy.hpp"

namespace quid {

/**
 * Generate a random UUID (version 4).
 *
 * All 122 non-marker bits come from the entropy source. Fails with
 * ErrorCode::EntropySource when the source cannot supply bytes; callers
 * wanting the nil sentinel use value_or(Uuid::nil()).
 */
[[nodiscard]] Result<Uuid, Error> new_v4();
[[nodiscard]] Result<Uuid, Error> new_v4(crypto::EntropySource& entropy);

/**
 * Generate a time-ordered UUID (version 7).
 *
 * Bytes 0-5 hold `now` in milliseconds, big-endian; bytes 8-15 are
 * random. Ordering among UUIDs created within the same millisecond is
 * not guaranteed.
 */
[[nodiscard]] Result<Uuid, Error> new_v7();
[[nodiscard]] Result<Uuid, Error> new_v7(crypto::EntropySource& entropy, Timestamp now);

} // namespace quid
