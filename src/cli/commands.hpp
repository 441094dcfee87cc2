#pragma once

#include "core/result.hpp"
#include "crypto/entropy.hpp"

#include <QString>
#include <QStringList>

namespace quid::cli {

struct GenerateOptions {
    int version = 4;
    int count = 1;
};

// Resolves the generate flags. Explicit --v4/--v7 wins over
// QUID_DEFAULT_VERSION, which wins over version 4.
[[nodiscard]] Result<GenerateOptions> resolve_generate_options(bool v4,
                                                               bool v7,
                                                               const QString& count,
                                                               const QString& default_version);

// One canonical UUID per line.
[[nodiscard]] Result<QString> generate(const GenerateOptions& options,
                                       crypto::EntropySource& entropy);

// Per UUID: version, variant and, for version 7, the embedded time.
// Stops at the first malformed input.
[[nodiscard]] Result<QString> inspect(const QStringList& ids);

// The 16 bytes of `id` as 32 contiguous lowercase hex digits.
[[nodiscard]] Result<QString> binary_hex(const QString& id);

} // namespace quid::cli
