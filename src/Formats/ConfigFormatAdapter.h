#pragma once
//
// ConfigFormatAdapter.h
//
// PURPOSE
// -------
// Boundary between bytes on disk and the canonical ConfigDocument.
//
//   bytes --parse()-->  ConfigDocument  --serialize()--> bytes
//
// One adapter per schema:
//   - PrimaryConfigAdapter  (JSON or TOML encoding of the Primary schema)
//   - ClientConfigAdapter   (YAML, client tool schema)
//
// Fidelity rules shared by all adapters:
//   - keys the model does not understand are kept in `extra` and written back
//   - collection order is preserved
//   - parse(serialize(parse(b))) == parse(b)
//
// Adapters do no file I/O. DocumentController reads/writes the file and hands
// the bytes over, so an adapter failure never leaves a half-written file.
//

#include <QByteArray>
#include <QString>

#include <memory>

#include "ConfigError.h"
#include "ConfigModel.h"

class ConfigFormatAdapter
{
public:
    virtual ~ConfigFormatAdapter() = default;

    virtual DocumentFormat format() const = 0;

    // Fills *out (format set, filePath left empty). MalformedDocument /
    // UnsupportedVersion on failure; *out is untouched then.
    virtual bool parse(const QByteArray &bytes, ConfigDocument *out,
                       ConfigError *err = nullptr) const = 0;

    virtual bool serialize(const ConfigDocument &doc, QByteArray *out,
                           ConfigError *err = nullptr) const = 0;

    static std::unique_ptr<ConfigFormatAdapter> forFormat(DocumentFormat format);

    // Extension first (.json, .toml, .yaml/.yml). For anything else the
    // content is sniffed: '{' -> JSON, TOML key/header lines -> TOML,
    // otherwise YAML.
    static DocumentFormat formatForPath(const QString &path,
                                        const QByteArray &content = QByteArray());

    // Same, extension only. Returns false when the extension says nothing.
    static bool formatForExtension(const QString &path, DocumentFormat *out);
};
