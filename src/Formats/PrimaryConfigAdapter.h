#pragma once
//
// PrimaryConfigAdapter.h
//
// Primary schema, two encodings:
//
//   JSON  <-> QJsonDocument::toVariant()/fromVariant()  \
//                                                         >  QVariantMap  <-> PrimaryDocument
//   TOML  <-> TomlCodec::parse()/serialize()            /
//
// Both encodings meet in one QVariantMap tree, so the schema mapping
// (required keys, types, duplicate names, curve tags, version marker, unknown
// keys) exists once in fromVariant()/toVariant().
//
// Schema (keys in snake_case on disk):
//
//   version      string, optional; must be one of supportedVersions()
//   groups       array, required
//     name       string, required
//     active     bool, optional (default false)
//     profiles   array, required
//       name, rpc_url              string, required
//       graphql_url, grpc_url      string, optional
//       active                     bool, optional
//     identities array, required
//       alias, public_key          string, required (public_key = base64(flag||pk))
//       curve                      string, optional, must agree with the flag
//       address                    string, optional, must match the key
//       active                     bool, optional
//
// Anything else, at any level, lands in `extra`.
//

#include <QStringList>
#include <QVariantMap>

#include "ConfigFormatAdapter.h"

class PrimaryConfigAdapter : public ConfigFormatAdapter
{
public:
    // PrimaryJson or PrimaryToml
    explicit PrimaryConfigAdapter(DocumentFormat encoding = DocumentFormat::PrimaryJson);

    DocumentFormat format() const override { return m_encoding; }

    bool parse(const QByteArray &bytes, ConfigDocument *out,
               ConfigError *err = nullptr) const override;

    bool serialize(const ConfigDocument &doc, QByteArray *out,
                   ConfigError *err = nullptr) const override;

    // Schema mapper shared by both encodings.
    static bool fromVariant(const QVariantMap &root, PrimaryDocument *out,
                            ConfigError *err = nullptr);
    static QVariantMap toVariant(const PrimaryDocument &doc);

    static QStringList supportedVersions();
    static QString currentVersion();

private:
    DocumentFormat m_encoding;
};
