#include <catch2/catch_test_macros.hpp>

#include "cli/logging.hpp"

#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

using namespace quid::cli;

TEST_CASE("CLI logging: records follow the installed pattern", "[integration][cli][logging]") {
    qunsetenv("QUID_LOG_FILE");
    install_logging();

    const QMessageLogContext ctx(nullptr, 0, nullptr, "quid.cli");
    const auto line = qFormatLogMessage(QtWarningMsg, ctx, QStringLiteral("entropy unavailable"));

    const QRegularExpression shape(
        QStringLiteral(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3} warning quid\.cli entropy unavailable$)"));
    REQUIRE(shape.match(line).hasMatch());

    qInstallMessageHandler(nullptr);
}

TEST_CASE("CLI logging: QUID_LOG_FILE receives formatted records", "[integration][cli][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/quid.log"));

    qputenv("QUID_LOG_FILE", path.toUtf8());
    REQUIRE(log_file_path() == path);
    install_logging();

    qCWarning(quidCliLog) << "generation failed";
    qCDebug(quidCliLog) << "filtered out by default";

    // Detach the file before reading it back.
    qunsetenv("QUID_LOG_FILE");
    install_logging();
    qInstallMessageHandler(nullptr);

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());

    REQUIRE(contents.contains(QStringLiteral(" warning quid.cli generation failed\n")));
    REQUIRE_FALSE(contents.contains(QStringLiteral("filtered out by default")));
}
