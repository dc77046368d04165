#include "ConfigFormatAdapter.h"

#include "ClientConfigAdapter.h"
#include "PrimaryConfigAdapter.h"

#include <QFileInfo>
#include <QRegularExpression>

std::unique_ptr<ConfigFormatAdapter> ConfigFormatAdapter::forFormat(DocumentFormat format)
{
    switch (format) {
        case DocumentFormat::PrimaryJson:
        case DocumentFormat::PrimaryToml:
            return std::unique_ptr<ConfigFormatAdapter>(new PrimaryConfigAdapter(format));
        case DocumentFormat::ClientYaml:
            return std::unique_ptr<ConfigFormatAdapter>(new ClientConfigAdapter());
    }
    return nullptr;
}

bool ConfigFormatAdapter::formatForExtension(const QString &path, DocumentFormat *out)
{
    const QString ext = QFileInfo(path).suffix().toLower();

    if (ext == "json") { *out = DocumentFormat::PrimaryJson; return true; }
    if (ext == "toml") { *out = DocumentFormat::PrimaryToml; return true; }
    if (ext == "yaml" || ext == "yml") { *out = DocumentFormat::ClientYaml; return true; }
    return false;
}

DocumentFormat ConfigFormatAdapter::formatForPath(const QString &path, const QByteArray &content)
{
    DocumentFormat f = DocumentFormat::PrimaryJson;
    if (formatForExtension(path, &f))
        return f;

    const QString text = QString::fromUtf8(content).trimmed();
    if (text.startsWith('{'))
        return DocumentFormat::PrimaryJson;

    // TOML: a [table] / [[array]] header or `key = value` at line start.
    // YAML uses `key: value`, so '=' before any ':' is a good tell.
    static const QRegularExpression tomlLine(
        "^\\s*(\\[\\[?[^\\]]+\\]\\]?\\s*$|[A-Za-z0-9_\"'.-]+\\s*=)",
        QRegularExpression::MultilineOption);
    if (tomlLine.match(text).hasMatch())
        return DocumentFormat::PrimaryToml;

    return DocumentFormat::ClientYaml;
}
