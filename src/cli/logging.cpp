#include "cli/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(quidCliLog, "quid.cli", QtWarningMsg)

namespace quid::cli {
namespace {

// Serialises writes from any thread; the optional file is reopened on
// every install_logging() call.
class LogSink {
public:
    void reset(const QString& path) {
        QMutexLocker lock(&mu_);
        file_.close();
        if (path.isEmpty()) {
            return;
        }

        QDir().mkpath(QFileInfo(path).absolutePath());
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "quid: cannot open log file %s\n", qPrintable(path));
        }
    }

    void write(const QByteArray& line) {
        QMutexLocker lock(&mu_);
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
    }

private:
    QMutex mu_;
    QFile file_;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

void handle_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    sink().write((qFormatLogMessage(type, ctx, msg) + QLatin1Char('\n')).toUtf8());
}

} // namespace

void install_logging() {
    sink().reset(log_file_path());
    qSetMessagePattern(QString::fromLatin1(LOG_PATTERN));
    qInstallMessageHandler(handle_message);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("quid.cli.debug=true\nquid.cli.info=true\n"));
}

QString log_file_path() {
    return qEnvironmentVariable("QUID_LOG_FILE");
}

} // namespace quid::cli
