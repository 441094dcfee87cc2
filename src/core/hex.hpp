#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace quid::hex {

// Lowercase hex rendering of `bytes`, two digits per byte.
[[nodiscard]] std::string encode(std::span<const uint8_t> bytes);

// Decodes `text` into exactly `out.size()` bytes. Both digit cases are
// accepted. Fails with ErrorCode::InvalidHex on any non-hex character or
// when `text` does not hold exactly two digits per output byte. `out` is
// only written on success.
[[nodiscard]] Result<void, Error> decode_into(std::string_view text, std::span<uint8_t> out);

} // namespace quid::hex
