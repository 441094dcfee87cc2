#include "core/generator.hpp"

namespace quid {

namespace {

constexpr uint8_t VARIANT_RFC4122 = 0x80;

void stamp(Uuid::Bytes& bytes, Version version) {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (version.value() << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | VARIANT_RFC4122);
}

} // namespace

Result<Uuid, Error> new_v4() {
    return new_v4(crypto::default_entropy());
}

Result<Uuid, Error> new_v4(crypto::EntropySource& entropy) {
    Uuid::Bytes bytes{};

    auto filled = entropy.fill(bytes);
    if (filled.is_err()) {
        return Result<Uuid, Error>::err(filled.unwrap_err());
    }

    stamp(bytes, VERSION_RANDOM);
    return Result<Uuid, Error>::ok(Uuid(bytes));
}

Result<Uuid, Error> new_v7() {
    return new_v7(crypto::default_entropy(), Timestamp::now());
}

Result<Uuid, Error> new_v7(crypto::EntropySource& entropy, Timestamp now) {
    Uuid::Bytes bytes{};

    // 48 significant bits shifted into the top of a big-endian u64;
    // bytes 6-7 end up zero and are claimed by the version nibble.
    const uint64_t packed = static_cast<uint64_t>(now.millis()) << 16;
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(packed >> (56 - 8 * i));
    }

    auto filled = entropy.fill(std::span<uint8_t>(bytes).subspan(8));
    if (filled.is_err()) {
        return Result<Uuid, Error>::err(filled.unwrap_err());
    }

    stamp(bytes, VERSION_TIME_ORDERED);
    return Result<Uuid, Error>::ok(Uuid(bytes));
}

} // namespace quid
