#include "core/hex.hpp"

#include <algorithm>
#include <array>
#include <sodium.h>

namespace quid::hex {

std::string encode(std::span<const uint8_t> bytes) {
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
    out.pop_back();
    return out;
}

Result<void, Error> decode_into(std::string_view text, std::span<uint8_t> out) {
    // Widest group in the canonical form is 12 digits / 6 bytes.
    std::array<uint8_t, 16> scratch{};
    if (out.size() > scratch.size() || text.size() != out.size() * 2) {
        return Result<void, Error>::err(Error{"odd or mismatched hex group length", ErrorCode::InvalidHex});
    }

    size_t decoded = 0;
    const int rc = sodium_hex2bin(scratch.data(), scratch.size(),
                                  text.data(), text.size(),
                                  nullptr, &decoded, nullptr);
    if (rc != 0 || decoded != out.size()) {
        return Result<void, Error>::err(Error{"invalid hex digit in \"" + std::string(text) + "\"",
                                              ErrorCode::InvalidHex});
    }

    std::copy(scratch.begin(), scratch.begin() + static_cast<std::ptrdiff_t>(decoded), out.begin());
    return Result<void, Error>::ok();
}

} // namespace quid::hex
