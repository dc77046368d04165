#pragma once

#include <QString>
#include <QJsonObject>

//
// AuditLogger
// -----------
// Append-only trail of what happened to configuration documents:
//
//   <AppLocalDataLocation>/audit/audit-YYYY-MM-DD.jsonl   (or an override dir)
//
// One compact JSON object per line:
//
//   {"ts":"...","event":"document.mutate","app":"chaincfg","session":"...",
//    "pid":123,"ok":true,"path":"/home/me/cfg.json","command":"add-identity",...}
//
// Events written by DocumentController:
//   document.new, document.load, document.save, document.mutate
//   (failures carry "ok":false plus "error_code" / "error")
//
// Callers decide the fields. Never pass key material: public keys are not
// secret but stay out of the trail anyway; aliases and addresses are enough.
//
// Write failures drop the event quietly; auditing never fails an operation.
//

namespace AuditLogger {
    void install(const QString& appName);

    // Closes the current file (tests, shutdown).
    void shutdown();

    void setSessionId(const QString& sessionId);
    QString sessionId();

    // Random id for one process run.
    QString newSessionId();

    QString auditDir();
    QString currentLogFilePath();

    void setAuditDirOverride(const QString& absoluteDirPath); // empty => use default
    QString auditDirOverride();

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());

    // writeEvent() with "ok":false, "error_code" and "error" added.
    void writeFailure(const QString& eventName, const QString& errorCode,
                      const QString& message, const QJsonObject& fields = QJsonObject());
}
