// PrimaryConfigAdapter.cpp
//
// Mapping notes:
// - Known keys are take()n out of each object; whatever is left over becomes
//   the entity's `extra` map and is merged back first on write, so known
//   keys always win over stale copies.
// - Errors carry a location like "groups[1].identities[0]" so a hand-edited
//   file can be fixed without guessing.
// - QJsonDocument keeps the last of two equal keys, so JSON input is first
//   walked with nlohmann's parser callback, which sees every key event.
// - Loading ends with ActiveSelection::normalize(), so the model satisfies
//   the single-active rule even when the file does not.

#include "PrimaryConfigAdapter.h"

#include "ActiveSelection.h"
#include "KeyMaterialGenerator.h"
#include "TomlCodec.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>
#include <QVariantList>

#include <nlohmann/json.hpp>

#include <vector>

static QString tr(const char *s)
{
    return QCoreApplication::translate("PrimaryConfigAdapter", s);
}

// -----------------------------
// Typed access to QVariant trees
// -----------------------------
static bool isString(const QVariant &v) { return v.userType() == QMetaType::QString; }
static bool isBool(const QVariant &v)   { return v.userType() == QMetaType::Bool; }
static bool isList(const QVariant &v)   { return v.userType() == QMetaType::QVariantList; }
static bool isMap(const QVariant &v)    { return v.userType() == QMetaType::QVariantMap; }

static bool takeString(QVariantMap &obj, const QString &key, bool required,
                       QString *out, const QString &where, ConfigError *err)
{
    if (!obj.contains(key)) {
        if (!required) return true;
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: missing required key '%2'").arg(where, key));
    }

    const QVariant v = obj.take(key);
    if (!isString(v))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: '%2' must be a string").arg(where, key));

    *out = v.toString();
    return true;
}

static bool takeBool(QVariantMap &obj, const QString &key, bool *out,
                     const QString &where, ConfigError *err)
{
    if (!obj.contains(key)) {
        *out = false;
        return true;
    }

    const QVariant v = obj.take(key);
    if (!isBool(v))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: '%2' must be true or false").arg(where, key));

    *out = v.toBool();
    return true;
}

static bool takeList(QVariantMap &obj, const QString &key, QVariantList *out,
                     const QString &where, ConfigError *err)
{
    if (!obj.contains(key))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: missing required key '%2'").arg(where, key));

    const QVariant v = obj.take(key);
    if (!isList(v))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: '%2' must be an array").arg(where, key));

    *out = v.toList();
    return true;
}

static QString at(const QString &parent, const QString &key, int index)
{
    const QString self = QString("%1[%2]").arg(key).arg(index);
    return parent.isEmpty() ? self : parent + "." + self;
}

// -----------------------------
// Entities: variant -> model
// -----------------------------
static bool profileFromVariant(const QVariant &v, Profile *out, const QString &where,
                               ConfigError *err)
{
    if (!isMap(v))
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: must be an object").arg(where));

    QVariantMap obj = v.toMap();
    Profile p;

    if (!takeString(obj, "name", true, &p.name, where, err)) return false;
    if (!takeString(obj, "rpc_url", true, &p.rpcUrl, where, err)) return false;
    if (!takeString(obj, "graphql_url", false, &p.graphqlUrl, where, err)) return false;
    if (!takeString(obj, "grpc_url", false, &p.grpcUrl, where, err)) return false;
    if (!takeBool(obj, "active", &p.active, where, err)) return false;

    p.extra = obj;
    *out = p;
    return true;
}

static bool identityFromVariant(const QVariant &v, Identity *out, const QString &where,
                                ConfigError *err)
{
    if (!isMap(v))
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: must be an object").arg(where));

    QVariantMap obj = v.toMap();
    Identity id;
    QString encodedKey;
    QString curveTag;
    QString storedAddress;

    if (!takeString(obj, "alias", true, &id.alias, where, err)) return false;
    if (!takeString(obj, "public_key", true, &encodedKey, where, err)) return false;
    if (!takeString(obj, "curve", false, &curveTag, where, err)) return false;
    if (!takeString(obj, "address", false, &storedAddress, where, err)) return false;
    if (!takeBool(obj, "active", &id.active, where, err)) return false;

    ConfigError keyErr;
    if (!KeyMaterialGenerator::decodePublicKey(encodedKey, &id.curve, &id.publicKey, &keyErr))
        return failWith(err, ErrorCode::MalformedDocument,
                        QString("%1: %2").arg(where, keyErr.message));

    if (!curveTag.isEmpty()) {
        const KeyCurve tagged = curveFromString(curveTag);
        if (tagged == KeyCurve::Unknown)
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("%1: unknown curve '%2'").arg(where, curveTag));
        if (tagged != id.curve)
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("%1: curve '%2' does not match public_key (%3)")
                                .arg(where, curveTag, curveToString(id.curve)));
    }

    id.address = KeyMaterialGenerator::deriveAddress(id.curve, id.publicKey);
    if (id.address.isEmpty())
        return failWith(err, ErrorCode::EntropyUnavailable,
                        tr("%1: could not derive address (libsodium unavailable)").arg(where));

    if (!storedAddress.isEmpty() && storedAddress.toLower() != id.address)
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: address %2 does not match public_key").arg(where, storedAddress));

    id.extra = obj;
    *out = id;
    return true;
}

static bool groupFromVariant(const QVariant &v, Group *out, const QString &where,
                             ConfigError *err)
{
    if (!isMap(v))
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: must be an object").arg(where));

    QVariantMap obj = v.toMap();
    Group g;
    QVariantList profiles;
    QVariantList identities;

    if (!takeString(obj, "name", true, &g.name, where, err)) return false;
    if (!takeBool(obj, "active", &g.active, where, err)) return false;
    if (!takeList(obj, "profiles", &profiles, where, err)) return false;
    if (!takeList(obj, "identities", &identities, where, err)) return false;

    QSet<QString> seen;
    for (int i = 0; i < profiles.size(); ++i) {
        Profile p;
        const QString here = at(where, "profiles", i);
        if (!profileFromVariant(profiles[i], &p, here, err)) return false;
        if (seen.contains(p.name))
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("%1: duplicate profile name '%2'").arg(here, p.name));
        seen.insert(p.name);
        g.profiles.push_back(p);
    }

    seen.clear();
    for (int i = 0; i < identities.size(); ++i) {
        Identity id;
        const QString here = at(where, "identities", i);
        if (!identityFromVariant(identities[i], &id, here, err)) return false;
        if (seen.contains(id.alias))
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("%1: duplicate alias '%2'").arg(here, id.alias));
        seen.insert(id.alias);
        g.identities.push_back(id);
    }

    g.extra = obj;
    *out = g;
    return true;
}

// -----------------------------
// Entities: model -> variant
// -----------------------------
static QVariantMap profileToVariant(const Profile &p)
{
    QVariantMap o = p.extra;
    o["name"] = p.name;
    o["active"] = p.active;
    o["rpc_url"] = p.rpcUrl;
    if (!p.graphqlUrl.isEmpty()) o["graphql_url"] = p.graphqlUrl;
    if (!p.grpcUrl.isEmpty())    o["grpc_url"] = p.grpcUrl;
    return o;
}

static QVariantMap identityToVariant(const Identity &id)
{
    QVariantMap o = id.extra;
    o["alias"] = id.alias;
    o["active"] = id.active;
    o["public_key"] = KeyMaterialGenerator::encodePublicKey(id.curve, id.publicKey);
    o["curve"] = curveToString(id.curve);
    o["address"] = id.address;
    return o;
}

static QVariantMap groupToVariant(const Group &g)
{
    QVariantMap o = g.extra;
    o["name"] = g.name;
    o["active"] = g.active;

    QVariantList profiles;
    for (const auto &p : g.profiles) profiles << profileToVariant(p);
    o["profiles"] = profiles;

    QVariantList identities;
    for (const auto &id : g.identities) identities << identityToVariant(id);
    o["identities"] = identities;

    return o;
}

// =====================================================
// PrimaryConfigAdapter
// =====================================================
PrimaryConfigAdapter::PrimaryConfigAdapter(DocumentFormat encoding)
    : m_encoding(encoding == DocumentFormat::PrimaryToml ? DocumentFormat::PrimaryToml
                                                         : DocumentFormat::PrimaryJson)
{
}

QStringList PrimaryConfigAdapter::supportedVersions()
{
    return { QStringLiteral("1.0.0") };
}

QString PrimaryConfigAdapter::currentVersion()
{
    return supportedVersions().last();
}

bool PrimaryConfigAdapter::fromVariant(const QVariantMap &root, PrimaryDocument *out,
                                       ConfigError *err)
{
    QVariantMap obj = root;
    PrimaryDocument doc;

    if (obj.contains("version")) {
        const QVariant v = obj.take("version");
        if (!isString(v))
            return failWith(err, ErrorCode::MalformedDocument, tr("'version' must be a string"));

        doc.version = v.toString();
        if (!supportedVersions().contains(doc.version))
            return failWith(err, ErrorCode::UnsupportedVersion,
                            tr("Unsupported configuration version '%1' (supported: %2)")
                                .arg(doc.version, supportedVersions().join(", ")));
    }

    QVariantList groups;
    if (!takeList(obj, "groups", &groups, tr("document"), err)) return false;

    QSet<QString> seen;
    for (int i = 0; i < groups.size(); ++i) {
        Group g;
        const QString here = at(QString(), "groups", i);
        if (!groupFromVariant(groups[i], &g, here, err)) return false;
        if (seen.contains(g.name))
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("%1: duplicate group name '%2'").arg(here, g.name));
        seen.insert(g.name);
        doc.groups.push_back(g);
    }

    doc.extra = obj;
    *out = doc;
    if (err) err->clear();
    return true;
}

QVariantMap PrimaryConfigAdapter::toVariant(const PrimaryDocument &doc)
{
    QVariantMap root = doc.extra;
    if (!doc.version.isEmpty())
        root["version"] = doc.version;

    QVariantList groups;
    for (const auto &g : doc.groups) groups << groupToVariant(g);
    root["groups"] = groups;

    return root;
}

// Returns false and names the key when any JSON object repeats a key.
// Syntax errors are left to QJsonDocument, which reports them with an offset.
static bool checkUniqueJsonKeys(const QByteArray &bytes, QString *duplicate)
{
    std::vector<QSet<QString>> open;
    bool clean = true;

    nlohmann::json::parser_callback_t cb =
        [&](int, nlohmann::json::parse_event_t event, nlohmann::json &parsed) {
            switch (event) {
                case nlohmann::json::parse_event_t::object_start:
                    open.emplace_back();
                    break;
                case nlohmann::json::parse_event_t::object_end:
                    if (!open.empty()) open.pop_back();
                    break;
                case nlohmann::json::parse_event_t::key: {
                    const QString key = QString::fromStdString(parsed.get<std::string>());
                    if (clean && !open.empty() && open.back().contains(key)) {
                        clean = false;
                        *duplicate = key;
                    }
                    if (!open.empty()) open.back().insert(key);
                    break;
                }
                default:
                    break;
            }
            return true;
        };

    const nlohmann::json scanned =
        nlohmann::json::parse(bytes.constData(), bytes.constData() + bytes.size(), cb, false);
    Q_UNUSED(scanned);
    return clean;
}

bool PrimaryConfigAdapter::parse(const QByteArray &bytes, ConfigDocument *out,
                                 ConfigError *err) const
{
    QVariantMap root;

    if (m_encoding == DocumentFormat::PrimaryJson) {
        QJsonParseError perr;
        const QJsonDocument jd = QJsonDocument::fromJson(bytes, &perr);
        if (perr.error != QJsonParseError::NoError)
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("Invalid JSON at offset %1: %2")
                                .arg(perr.offset).arg(perr.errorString()));
        if (!jd.isObject())
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("Invalid JSON: top level must be an object"));
        QString duplicate;
        if (!checkUniqueJsonKeys(bytes, &duplicate))
            return failWith(err, ErrorCode::MalformedDocument,
                            tr("Invalid JSON: duplicate key '%1'").arg(duplicate));
        root = jd.object().toVariantMap();
    } else {
        QString perr;
        if (!TomlCodec::parse(bytes, &root, &perr))
            return failWith(err, ErrorCode::MalformedDocument, tr("Invalid TOML: %1").arg(perr));
    }

    ConfigDocument doc;
    doc.format = m_encoding;
    if (!fromVariant(root, &doc.primary, err))
        return false;

    if (ActiveSelection::normalize(doc))
        qInfo() << "Primary config had inconsistent active flags; normalized on load";

    *out = doc;
    if (err) err->clear();
    return true;
}

bool PrimaryConfigAdapter::serialize(const ConfigDocument &doc, QByteArray *out,
                                     ConfigError *err) const
{
    if (doc.isClient())
        return failWith(err, ErrorCode::UnsupportedCommand,
                        tr("A client document cannot be written in the primary schema"));

    const QVariantMap root = toVariant(doc.primary);

    if (m_encoding == DocumentFormat::PrimaryJson)
        *out = QJsonDocument(QJsonObject::fromVariantMap(root)).toJson(QJsonDocument::Indented);
    else
        *out = TomlCodec::serialize(root);

    if (err) err->clear();
    return true;
}
