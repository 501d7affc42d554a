#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

Q_LOGGING_CATEGORY(vellumSyncLog, "vellum.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(vellumCryptoLog, "vellum.crypto", QtInfoMsg)
Q_LOGGING_CATEGORY(vellumStorageLog, "vellum.storage", QtInfoMsg)

namespace vellum {
namespace {

constexpr qint64 kMaxLogBytes = 1024 * 1024;

QLatin1Char level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1Char('D');
        case QtInfoMsg: return QLatin1Char('I');
        case QtWarningMsg: return QLatin1Char('W');
        case QtCriticalMsg: return QLatin1Char('C');
        case QtFatalMsg: return QLatin1Char('F');
    }
    return QLatin1Char('?');
}

/**
 * Append-only log file. Opened on first write; once it would grow past
 * kMaxLogBytes the current file becomes <path>.1 and a new one starts.
 * After a failed open it stays silent.
 */
class LogFile {
public:
    explicit LogFile(QString path) : path_(std::move(path)) {}

    void append(const QByteArray& line) {
        if (!ready()) return;
        if (file_.size() + line.size() > kMaxLogBytes) {
            rotate();
            if (!file_.isOpen()) return;
        }
        file_.write(line);
        file_.flush();
    }

private:
    bool ready() {
        if (file_.isOpen()) return true;
        if (broken_ || path_.isEmpty()) return false;
        if (!QDir().mkpath(QFileInfo(path_).absolutePath()) || !open(QIODevice::Append)) {
            broken_ = true;
            std::fprintf(stderr, "vellum: cannot open log file %s\n", qPrintable(path_));
            return false;
        }
        return true;
    }

    bool open(QIODevice::OpenModeFlag mode) {
        file_.setFileName(path_);
        return file_.open(QIODevice::WriteOnly | QIODevice::Text | mode);
    }

    void rotate() {
        file_.close();
        const auto previous = path_ + QStringLiteral(".1");
        const bool moved = (!QFile::exists(previous) || QFile::remove(previous)) &&
                           QFile::rename(path_, previous);
        // Without a rotated copy, start over rather than grow without bound.
        if (!open(moved ? QIODevice::Append : QIODevice::Truncate)) {
            broken_ = true;
        }
    }

    QString path_;
    QFile file_;
    bool broken_ = false;
};

struct Sink {
    QMutex mutex;
    LogFile file{default_log_file_path()};
    QtMessageHandler chained = nullptr;
};

Sink& sink() {
    static Sink s;
    return s;
}

void write_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    {
        QMutexLocker lock(&s.mutex);
        const auto line = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs) +
                          QLatin1Char(' ') + level_letter(type) + QLatin1Char(' ') +
                          QLatin1String(ctx.category ? ctx.category : "default") +
                          QStringLiteral(": ") + msg + QLatin1Char('\n');
        s.file.append(line.toUtf8());
    }
    if (s.chained) {
        s.chained(type, ctx, msg);
    } else {
        std::fprintf(stderr, "%s\n", qPrintable(qFormatLogMessage(type, ctx, msg)));
    }
}

} // namespace

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{if-category}%{category}: %{endif}%{message}"));
    auto& s = sink();
    const auto previous = qInstallMessageHandler(write_message);
    if (previous != write_message) {
        s.chained = previous;
    }
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/vellum.log"));
}

void configure_debug_categories(bool force) {
    if (force || qEnvironmentVariableIsSet("VELLUM_DEBUG_SYNC")) {
        QLoggingCategory::setFilterRules(QStringLiteral("vellum.sync.debug=true\n"));
    }
}

} // namespace vellum
