// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QDebug>

#include <cstdio>
#include <cstdlib>

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Process-wide state
// =====================================================

static QFile*     g_file  = nullptr;   // open log file (owned)
static QMutex     g_mutex;             // guards g_file / g_path / g_pathOverride
static QString    g_path;
static QString    g_pathOverride;
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QAtomicInt g_echo(0);           // 1 = mirror to stderr

static constexpr qint64 kRotateBytes = 2 * 1024 * 1024;
static constexpr int    kRotateKeep  = 3;

// A handler that logs would re-enter itself.
static thread_local bool g_inHandler = false;

static const char* levelTag(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0 = WARN and above, 1 = INFO and above, 2 = everything
static bool accepted(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    switch (type) {
        case QtDebugMsg:    return lvl >= 2;
        case QtInfoMsg:     return lvl >= 1;
        case QtWarningMsg:
        case QtCriticalMsg:
        case QtFatalMsg:    return true;
    }
    return true;
}

// One record = one physical line.
static QString oneLine(QString s)
{
    s.replace("\r\n", " ");
    s.replace('\r', ' ');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static QString formatRecord(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = QString("%1 [%2] ").arg(ts, QLatin1String(levelTag(type)));
    if (ctx.file && ctx.function) {
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    }
    line += oneLine(msg);
    return line;
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!accepted(type) || g_inHandler) {
        if (type == QtFatalMsg) std::abort();
        return;
    }
    g_inHandler = true;

    const QString line = formatRecord(type, ctx, msg);
    const bool echo = g_echo.loadAcquire() != 0;

    {
        QMutexLocker lock(&g_mutex);

        if (g_file && g_file->isOpen()) {
            QTextStream out(g_file);
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
            out.setEncoding(QStringConverter::Utf8);
#else
            out.setCodec("UTF-8");
#endif
            out << line << "\n";
            out.flush();
        }

        // No file: stderr is the only sink.
        if (echo || !g_file || !g_file->isOpen()) {
            std::fprintf(stderr, "%s\n", line.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        std::abort();
}

// log -> log.1 -> log.2 ... ; the oldest beyond kRotateKeep is dropped.
static void rotateIfNeeded(const QString& path)
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.size() < kRotateBytes)
        return;

    QFile::remove(path + "." + QString::number(kRotateKeep));
    for (int i = kRotateKeep - 1; i >= 1; --i) {
        const QString from = path + "." + QString::number(i);
        if (QFileInfo::exists(from))
            QFile::rename(from, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

// Must be called with g_mutex held.
static bool openLocked(const QString& path)
{
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    g_file = new QFile(path);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: cannot open log file %s: %s\n",
                     path.toUtf8().constData(),
                     g_file->errorString().toUtf8().constData());
        std::fflush(stderr);
        delete g_file;
        g_file = nullptr;
        return false;
    }

    g_path = path;
    return true;
}

namespace Logger {

void install(const QString& appName)
{
    const QString defaultPath =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
        + "/logs/" + appName + ".log";

    {
        QMutexLocker lock(&g_mutex);
        const QString chosen = g_pathOverride.isEmpty() ? defaultPath : g_pathOverride;
        openLocked(chosen);
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QString("Logger initialized: %1").arg(logFilePath());
}

void uninstall()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_mutex);
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setEchoToStderr(bool on)
{
    g_echo.storeRelease(on ? 1 : 0);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);

    const QString trimmed = absoluteFilePath.trimmed();
    g_pathOverride = trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);

    // Cleared: keep the current file; the next install() picks the default.
    if (g_pathOverride.isEmpty())
        return;

    openLocked(g_pathOverride);
}

QString logDirPath()
{
    const QString p = logFilePath();
    return p.isEmpty() ? QString() : QFileInfo(p).absolutePath();
}

} // namespace Logger
