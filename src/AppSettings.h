#pragma once

#include <QString>
#include <QStringList>

#include "ConfigModel.h"
#include "DocumentController.h"

//
// AppSettings
// -----------
// Typed access to the persisted editor settings (QSettings, organization and
// application name set in main()).
//
//   editor/default_curve        "ed25519"
//   editor/default_format       "json"
//   editor/default_rpc_url      "https://fullnode.devnet.sui.io:443"
//   editor/default_graphql_url  ""   (empty = none)
//   editor/default_grpc_url     ""   (empty = none)
//   logging/level               1    (0=errors, 1=normal, 2=debug)
//   logging/filePath            ""   (empty = default location)
//   audit/dirPath               ""   (empty = default location)
//   recent/files                most recent first, at most kMaxRecentFiles
//
// Invalid stored values fall back to the defaults above.
//

namespace AppSettings {
    constexpr int kMaxRecentFiles = 10;

    KeyCurve defaultCurve();
    void setDefaultCurve(KeyCurve curve);

    DocumentFormat defaultFormat();
    void setDefaultFormat(DocumentFormat format);

    QString defaultRpcUrl();
    QString defaultGraphqlUrl();
    QString defaultGrpcUrl();

    // Seeds for DocumentController::newDocument().
    NewDocumentDefaults newDocumentDefaults();

    int logLevel();
    QString logFilePath();
    QString auditDirPath();

    QStringList recentFiles();
    void addRecentFile(const QString& path);
    void clearRecentFiles();
}
