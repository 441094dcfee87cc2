#include "core/uuid.hpp"

#include "core/hex.hpp"

#include <algorithm>

namespace quid {

namespace {

// One hyphen-delimited group of the canonical text form.
struct Group {
    size_t text_offset;
    size_t text_length;
    size_t byte_offset;
    size_t byte_length;
};

constexpr std::array<Group, 5> GROUPS{{
    {0, 8, 0, 4},
    {9, 4, 4, 2},
    {14, 4, 6, 2},
    {19, 4, 8, 2},
    {24, 12, 10, 6},
}};

constexpr std::array<size_t, 4> SEPARATORS{8, 13, 18, 23};

[[nodiscard]] Result<Uuid::Bytes, Error> decode_text(std::string_view text) {
    if (text.size() != Uuid::TEXT_SIZE) {
        return Result<Uuid::Bytes, Error>::err(
            Error{"expected 36 characters, got " + std::to_string(text.size()), ErrorCode::InvalidLength});
    }

    for (auto pos : SEPARATORS) {
        if (text[pos] != '-') {
            return Result<Uuid::Bytes, Error>::err(
                Error{"expected '-' at index " + std::to_string(pos), ErrorCode::InvalidSeparator});
        }
    }

    Uuid::Bytes bytes{};
    for (const auto& g : GROUPS) {
        auto decoded = hex::decode_into(text.substr(g.text_offset, g.text_length),
                                        std::span<uint8_t>(bytes).subspan(g.byte_offset, g.byte_length));
        if (decoded.is_err()) {
            return Result<Uuid::Bytes, Error>::err(decoded.unwrap_err());
        }
    }

    return Result<Uuid::Bytes, Error>::ok(bytes);
}

[[nodiscard]] Result<Uuid::Bytes, Error> decode_binary(std::span<const uint8_t> data) {
    if (data.size() != Uuid::BYTE_SIZE) {
        return Result<Uuid::Bytes, Error>::err(
            Error{"expected 16 bytes, got " + std::to_string(data.size()), ErrorCode::InvalidLength});
    }

    Uuid::Bytes bytes{};
    std::copy(data.begin(), data.end(), bytes.begin());
    return Result<Uuid::Bytes, Error>::ok(bytes);
}

[[nodiscard]] std::string_view as_chars(std::span<const uint8_t> text) {
    return {reinterpret_cast<const char*>(text.data()), text.size()};
}

} // namespace

std::string Version::to_string() const {
    return std::to_string(value_);
}

Result<Uuid, Error> Uuid::from_bytes(std::span<const uint8_t> data) {
    return decode_binary(data).map([](const Bytes& b) { return Uuid(b); });
}

Result<Uuid, Error> Uuid::parse(std::string_view text) {
    return decode_text(text).map([](const Bytes& b) { return Uuid(b); });
}

Result<Uuid, Error> Uuid::parse_bytes(std::span<const uint8_t> text) {
    return parse(as_chars(text));
}

Result<void, Error> Uuid::assign_bytes(std::span<const uint8_t> data) {
    auto decoded = decode_binary(data);
    if (decoded.is_err()) {
        return Result<void, Error>::err(decoded.unwrap_err());
    }
    bytes_ = decoded.unwrap();
    return Result<void, Error>::ok();
}

Result<void, Error> Uuid::assign_text(std::string_view text) {
    auto decoded = decode_text(text);
    if (decoded.is_err()) {
        return Result<void, Error>::err(decoded.unwrap_err());
    }
    bytes_ = decoded.unwrap();
    return Result<void, Error>::ok();
}

Uuid::Text Uuid::to_text() const {
    const auto digits = hex::encode(bytes_);

    Text text{};
    auto out = text.begin();
    for (const auto& g : GROUPS) {
        if (g.text_offset != 0) {
            *out++ = '-';
        }
        out = std::copy_n(digits.begin() + static_cast<std::ptrdiff_t>(g.byte_offset * 2),
                          g.text_length, out);
    }
    return text;
}

std::string Uuid::to_string() const {
    const auto text = to_text();
    return std::string(text.begin(), text.end());
}

std::optional<Timestamp> Uuid::timestamp() const noexcept {
    if (version() != VERSION_TIME_ORDERED) {
        return std::nullopt;
    }

    uint64_t packed = 0;
    for (size_t i = 0; i < 8; ++i) {
        packed = (packed << 8) | bytes_[i];
    }
    return Timestamp(static_cast<int64_t>(packed >> 16));
}

std::vector<std::string> to_strings(std::span<const Uuid> ids) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        out.push_back(id.to_string());
    }
    return out;
}

} // namespace quid
