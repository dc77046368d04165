#include "AppSettings.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

namespace AppSettings {

KeyCurve defaultCurve()
{
    QSettings s;
    const KeyCurve c = curveFromString(s.value("editor/default_curve", "ed25519").toString());
    return (c == KeyCurve::Unknown) ? KeyCurve::Ed25519 : c;
}

void setDefaultCurve(KeyCurve curve)
{
    if (curve == KeyCurve::Unknown) return;
    QSettings s;
    s.setValue("editor/default_curve", curveToString(curve));
}

DocumentFormat defaultFormat()
{
    QSettings s;
    DocumentFormat f = DocumentFormat::PrimaryJson;
    if (!formatFromString(s.value("editor/default_format", "json").toString(), &f))
        return DocumentFormat::PrimaryJson;
    return f;
}

void setDefaultFormat(DocumentFormat format)
{
    QSettings s;
    s.setValue("editor/default_format", formatToString(format));
}

QString defaultRpcUrl()
{
    QSettings s;
    const QString v = s.value("editor/default_rpc_url").toString().trimmed();
    return v.isEmpty() ? NewDocumentDefaults().rpcUrl : v;
}

QString defaultGraphqlUrl()
{
    QSettings s;
    return s.value("editor/default_graphql_url", "").toString().trimmed();
}

QString defaultGrpcUrl()
{
    QSettings s;
    return s.value("editor/default_grpc_url", "").toString().trimmed();
}

NewDocumentDefaults newDocumentDefaults()
{
    NewDocumentDefaults d;
    d.curve      = defaultCurve();
    d.rpcUrl     = defaultRpcUrl();
    d.graphqlUrl = defaultGraphqlUrl();
    d.grpcUrl    = defaultGrpcUrl();
    return d;
}

int logLevel()
{
    QSettings s;
    bool ok = false;
    const int lvl = s.value("logging/level", 1).toInt(&ok);
    return ok ? qBound(0, lvl, 2) : 1;
}

// Empty = default location
QString logFilePath()
{
    QSettings s;
    return s.value("logging/filePath", "").toString().trimmed();
}

QString auditDirPath()
{
    QSettings s;
    return s.value("audit/dirPath", "").toString().trimmed();
}

QStringList recentFiles()
{
    QSettings s;
    return s.value("recent/files").toStringList();
}

void addRecentFile(const QString& path)
{
    if (path.trimmed().isEmpty()) return;

    const QString abs = QDir::cleanPath(QFileInfo(path).absoluteFilePath());

    QStringList list = recentFiles();
    list.removeAll(abs);
    list.prepend(abs);
    while (list.size() > kMaxRecentFiles)
        list.removeLast();

    QSettings s;
    s.setValue("recent/files", list);
}

void clearRecentFiles()
{
    QSettings s;
    s.remove("recent/files");
}

} // namespace AppSettings
