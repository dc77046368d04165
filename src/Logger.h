#pragma once
#include <QString>

//
// Logger
// ------
// Process-wide Qt message handler. Code logs with qDebug/qInfo/qWarning/
// qCritical; this routes the records to
//
//   <AppLocalDataLocation>/logs/<appName>.log    (or an override path)
//
// one line per record:
//
//   2026-01-02 10:11:12.345 [WARN] MutationEngine.cpp:512 apply - message
//
// Never log key material: aliases, curve names and addresses only.
//

namespace Logger {
    void install(const QString& appName);

    // Restores Qt's default handler and closes the file.
    void uninstall();

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Mirror accepted records to stderr as well (CLI --verbose).
    void setEchoToStderr(bool on);

    QString logFilePath();

    void setLogFilePathOverride(const QString& absoluteFilePath);  // empty => use default
    QString logDirPath();
}
