#include "cli/commands.hpp"

#include "cli/logging.hpp"
#include "core/generator.hpp"
#include "core/hex.hpp"
#include "core/uuid.hpp"

#include <QTextStream>

namespace quid::cli {

namespace {

constexpr int MAX_COUNT = 1'000'000;

[[nodiscard]] Result<int> parse_version(const QString& text) {
    const auto trimmed = text.trimmed();
    if (trimmed == QStringLiteral("4")) return Result<int>::ok(4);
    if (trimmed == QStringLiteral("7")) return Result<int>::ok(7);
    return Result<int>::err(Error{("Unsupported version: " + trimmed).toStdString()});
}

[[nodiscard]] Result<Uuid> parse_arg(const QString& text) {
    return Uuid::parse(text.toStdString()).map_err([&text](const Error& e) {
        return Error{("Invalid UUID \"" + text + "\": ").toStdString() + e.message, e.code};
    });
}

[[nodiscard]] const char* variant_name(const Uuid& id) {
    return (id.bytes()[8] & 0xC0) == 0x80 ? "rfc4122" : "other";
}

} // namespace

Result<GenerateOptions> resolve_generate_options(bool v4,
                                                 bool v7,
                                                 const QString& count,
                                                 const QString& default_version) {
    if (v4 && v7) {
        return Result<GenerateOptions>::err(Error{"Provide at most one of --v4 or --v7"});
    }

    GenerateOptions options;
    if (v4) {
        options.version = 4;
    } else if (v7) {
        options.version = 7;
    } else if (!default_version.isEmpty()) {
        auto resolved = parse_version(default_version);
        if (resolved.is_err()) {
            return Result<GenerateOptions>::err(resolved.unwrap_err());
        }
        options.version = resolved.unwrap();
    }

    if (!count.isEmpty()) {
        bool ok = false;
        const int n = count.toInt(&ok);
        if (!ok || n < 1 || n > MAX_COUNT) {
            return Result<GenerateOptions>::err(Error{("Invalid count: " + count).toStdString()});
        }
        options.count = n;
    }

    return Result<GenerateOptions>::ok(options);
}

Result<QString> generate(const GenerateOptions& options, crypto::EntropySource& entropy) {
    qCDebug(quidCliLog) << "generate version=" << options.version << "count=" << options.count;

    QString out;
    QTextStream stream(&out);
    for (int i = 0; i < options.count; ++i) {
        auto id = options.version == 7 ? new_v7(entropy, Timestamp::now()) : new_v4(entropy);
        if (id.is_err()) {
            qCWarning(quidCliLog) << "generation failed after" << i << "of" << options.count;
            return Result<QString>::err(id.unwrap_err());
        }
        stream << QString::fromStdString(id.unwrap().to_string()) << '\n';
    }
    stream.flush();
    return Result<QString>::ok(out);
}

Result<QString> inspect(const QStringList& ids) {
    if (ids.isEmpty()) {
        return Result<QString>::err(Error{"inspect requires at least one UUID"});
    }

    QString out;
    QTextStream stream(&out);
    for (const auto& arg : ids) {
        auto parsed = parse_arg(arg);
        if (parsed.is_err()) {
            return Result<QString>::err(parsed.unwrap_err());
        }

        const auto& id = parsed.unwrap();
        stream << QString::fromStdString(id.to_string()) << '\n';
        stream << "  version: " << QString::fromStdString(id.version().to_string()) << '\n';
        stream << "  variant: " << variant_name(id) << '\n';
        if (const auto ts = id.timestamp()) {
            stream << "  timestamp: " << QString::fromStdString(ts->to_iso_string())
                   << " (" << ts->millis() << ")\n";
        }
    }
    stream.flush();
    return Result<QString>::ok(out);
}

Result<QString> binary_hex(const QString& id) {
    return parse_arg(id).map([](const Uuid& u) {
        return QString::fromStdString(hex::encode(u.to_bytes())) + QLatin1Char('\n');
    });
}

} // namespace quid::cli
