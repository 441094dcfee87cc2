#include "crypto/entropy.hpp"

#include <sodium.h>

namespace quid::crypto {

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"failed to initialize libsodium", ErrorCode::EntropySource});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SodiumEntropySource::fill(std::span<uint8_t> out) {
    auto ready = init();
    if (ready.is_err()) {
        return ready;
    }
    randombytes_buf(out.data(), out.size());
    return Result<void, Error>::ok();
}

EntropySource& default_entropy() {
    static SodiumEntropySource source;
    return source;
}

} // namespace quid::crypto
