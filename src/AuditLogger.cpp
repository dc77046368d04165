// AuditLogger.cpp
#include "AuditLogger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QUuid>
#include <QCoreApplication>

// =====================================================
// Process-wide state
// =====================================================
//
// One mutex guards everything below. One file handle is kept open per day;
// when the day or the directory changes it is closed and reopened.
// =====================================================

static QMutex   g_auditMutex;
static QString  g_appName;
static QString  g_sessionId;
static QString  g_auditDirOverride;

static QFile*   g_auditFile = nullptr;  // owned
static QString  g_openDate;             // "yyyy-MM-dd" of the open file
static QString  g_openPath;

static QString dayKey()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd");
}

static QString defaultAuditDir()
{
    return QDir::cleanPath(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
                           + "/audit");
}

// -- the *Locked helpers require g_auditMutex --

static QString baseAuditDirLocked()
{
    return g_auditDirOverride.isEmpty() ? defaultAuditDir() : g_auditDirOverride;
}

static QString filePathForDayLocked(const QString& day)
{
    return QDir(baseAuditDirLocked()).filePath(QString("audit-%1.jsonl").arg(day));
}

static void closeAuditFileLocked()
{
    if (g_auditFile) {
        g_auditFile->close();
        delete g_auditFile;
        g_auditFile = nullptr;
    }
    g_openDate.clear();
    g_openPath.clear();
}

static bool ensureOpenLocked()
{
    const QString today = dayKey();
    const QString wantPath = filePathForDayLocked(today);

    if (g_auditFile && g_auditFile->isOpen() && g_openDate == today && g_openPath == wantPath)
        return true;

    closeAuditFileLocked();
    QDir().mkpath(baseAuditDirLocked());

    g_auditFile = new QFile(wantPath);
    if (!g_auditFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        closeAuditFileLocked();
        return false;
    }

    g_openDate = today;
    g_openPath = wantPath;
    return true;
}

namespace AuditLogger {

void install(const QString& appName)
{
    // No qInfo() here: the Logger may not be installed yet.
    QMutexLocker lock(&g_auditMutex);
    g_appName = appName;
    ensureOpenLocked();
}

void shutdown()
{
    QMutexLocker lock(&g_auditMutex);
    closeAuditFileLocked();
}

void setSessionId(const QString& sessionId)
{
    QMutexLocker lock(&g_auditMutex);
    g_sessionId = sessionId;
}

QString sessionId()
{
    QMutexLocker lock(&g_auditMutex);
    return g_sessionId;
}

QString newSessionId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

void setAuditDirOverride(const QString& absoluteDirPath)
{
    QMutexLocker lock(&g_auditMutex);

    const QString trimmed = absoluteDirPath.trimmed();
    const QString newVal = trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);
    if (newVal == g_auditDirOverride)
        return;

    g_auditDirOverride = newVal;
    closeAuditFileLocked();   // next write opens in the new directory
}

QString auditDirOverride()
{
    QMutexLocker lock(&g_auditMutex);
    return g_auditDirOverride;
}

QString auditDir()
{
    QMutexLocker lock(&g_auditMutex);
    return baseAuditDirLocked();
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_auditMutex);
    return g_openPath.isEmpty() ? filePathForDayLocked(dayKey()) : g_openPath;
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_auditMutex);

    if (!ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("pid", static_cast<qint64>(QCoreApplication::applicationPid()));
    if (!g_sessionId.isEmpty())
        o.insert("session", g_sessionId);
    if (!fields.contains("ok"))
        o.insert("ok", true);

    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    g_auditFile->write(QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n");
    g_auditFile->flush();
}

void writeFailure(const QString& eventName, const QString& errorCode,
                  const QString& message, const QJsonObject& fields)
{
    QJsonObject f = fields;
    f.insert("ok", false);
    f.insert("error_code", errorCode);
    f.insert("error", message);
    writeEvent(eventName, f);
}

} // namespace AuditLogger
