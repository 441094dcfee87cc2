#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/logging.hpp"
#include "crypto/entropy.hpp"

namespace {

int report(const quid::Result<QString>& result) {
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        qCDebug(quidCliLog).noquote() << QString::fromStdString(error.message)
                                      << "code=" << static_cast<int>(error.code);
        QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("quid");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Generate and inspect UUIDs"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption v4Option(
        QStringList{QStringLiteral("v4")},
        QStringLiteral("Generate random (version 4) UUIDs."));
    parser.addOption(v4Option);

    const QCommandLineOption v7Option(
        QStringList{QStringLiteral("v7")},
        QStringLiteral("Generate time-ordered (version 7) UUIDs."));
    parser.addOption(v7Option);

    const QCommandLineOption countOption(
        QStringList{QStringLiteral("n"), QStringLiteral("count")},
        QStringLiteral("Number of UUIDs to generate (default 1)."),
        QStringLiteral("count"));
    parser.addOption(countOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also enabled by QUID_DEBUG=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("generate, inspect <uuid>... or hex <uuid>."));
    parser.process(app);

    quid::cli::install_logging();
    if (parser.isSet(debugOption) || qEnvironmentVariableIntValue("QUID_DEBUG") == 1) {
        quid::cli::enable_debug_logging();
        qCDebug(quidCliLog) << "debug logging enabled, log file:" << quid::cli::log_file_path();
    }

    auto crypto_result = quid::crypto::init();
    if (crypto_result.is_err()) {
        qCCritical(quidCliLog) << "Failed to initialize crypto:"
                               << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("generate") : positional.takeFirst();

    if (command == QStringLiteral("generate")) {
        const auto options = quid::cli::resolve_generate_options(
            parser.isSet(v4Option),
            parser.isSet(v7Option),
            parser.value(countOption),
            qEnvironmentVariable("QUID_DEFAULT_VERSION"));
        if (options.is_err()) {
            return report(quid::Result<QString>::err(options.unwrap_err()));
        }
        return report(quid::cli::generate(options.unwrap(), quid::crypto::default_entropy()));
    }

    if (command == QStringLiteral("inspect")) {
        return report(quid::cli::inspect(positional));
    }

    if (command == QStringLiteral("hex")) {
        if (positional.size() != 1) {
            return report(quid::Result<QString>::err(quid::Error{"hex takes exactly one UUID"}));
        }
        return report(quid::cli::binary_hex(positional.first()));
    }

    QTextStream(stderr) << "Unknown command: " << command << QLatin1Char('\n');
    parser.showHelp(2);
}
