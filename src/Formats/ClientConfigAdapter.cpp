// ClientConfigAdapter.cpp
//
// yaml-cpp reports syntax and conversion problems as YAML::Exception
// (ParserException carries line/column in what()). They are caught at the
// parse()/serialize() boundary and turned into ConfigError values; nothing
// escapes the adapter.

#include "ClientConfigAdapter.h"

#include "ActiveSelection.h"
#include "KeyMaterialGenerator.h"

#include <QCoreApplication>
#include <QDebug>
#include <QSet>
#include <QVariantList>

#include <yaml-cpp/yaml.h>

#include <string>

static QString tr(const char *s)
{
    return QCoreApplication::translate("ClientConfigAdapter", s);
}

static QString qs(const std::string &s)
{
    return QString::fromStdString(s);
}

// -----------------------------
// Unknown keys: YAML <-> QVariant
// -----------------------------
static QVariant yamlToVariant(const YAML::Node &n)
{
    switch (n.Type()) {
        case YAML::NodeType::Scalar:
            return qs(n.Scalar());

        case YAML::NodeType::Sequence: {
            QVariantList l;
            for (const auto &child : n) l << yamlToVariant(child);
            return l;
        }

        case YAML::NodeType::Map: {
            QVariantMap m;
            for (auto it = n.begin(); it != n.end(); ++it)
                m.insert(qs(it->first.as<std::string>()), yamlToVariant(it->second));
            return m;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return QVariant();
}

static YAML::Node variantToYaml(const QVariant &v)
{
    switch (v.userType()) {
        case QMetaType::QVariantMap: {
            YAML::Node n(YAML::NodeType::Map);
            const QVariantMap m = v.toMap();
            for (auto it = m.cbegin(); it != m.cend(); ++it)
                n[it.key().toStdString()] = variantToYaml(it.value());
            return n;
        }

        case QMetaType::QVariantList: {
            YAML::Node n(YAML::NodeType::Sequence);
            for (const auto &e : v.toList()) n.push_back(variantToYaml(e));
            return n;
        }

        case QMetaType::Bool:
            return YAML::Node(v.toBool());

        case QMetaType::QString:
            return YAML::Node(v.toString().toStdString());

        default:
            break;
    }

    if (!v.isValid() || v.isNull())
        return YAML::Node(YAML::NodeType::Null);
    return YAML::Node(v.toString().toStdString());
}

static void appendExtra(YAML::Node &target, const QVariantMap &extra)
{
    for (auto it = extra.cbegin(); it != extra.cend(); ++it)
        target[it.key().toStdString()] = variantToYaml(it.value());
}

// -----------------------------
// Field helpers
// -----------------------------
static bool scalarString(const YAML::Node &n, const QString &where, const QString &key,
                         QString *out, ConfigError *err)
{
    if (!n.IsScalar())
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: '%2' must be a scalar").arg(where, key));
    *out = qs(n.Scalar());
    return true;
}

static bool scalarBool(const YAML::Node &n, const QString &where, const QString &key,
                       bool *out, ConfigError *err)
{
    bool v = false;
    if (!n.IsScalar() || !YAML::convert<bool>::decode(n, v))
        return failWith(err, ErrorCode::MalformedDocument,
                        tr("%1: '%2' must be true or false").arg(where, key));
    *out = v;
    return true;
}

static bool envFromYaml(const YAML::Node &n, const QString &where, Profile *out, ConfigError *err)
{
    if (!n.IsMap())
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: must be a mapping").arg(where));

    Profile p;
    bool haveAlias = false;
    bool haveRpc = false;

    for (auto it = n.begin(); it != n.end(); ++it) {
        const QString key = qs(it->first.as<std::string>());

        if (key == "alias") {
            if (!scalarString(it->second, where, key, &p.name, err)) return false;
            haveAlias = true;
        } else if (key == "rpc") {
            if (!scalarString(it->second, where, key, &p.rpcUrl, err)) return false;
            haveRpc = true;
        } else if (key == "active") {
            if (!scalarBool(it->second, where, key, &p.active, err)) return false;
        } else {
            p.extra.insert(key, yamlToVariant(it->second));
        }
    }

    if (!haveAlias)
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: missing required key 'alias'").arg(where));
    if (!haveRpc)
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: missing required key 'rpc'").arg(where));

    *out = p;
    return true;
}

static bool keyFromYaml(const YAML::Node &n, const QString &where, Identity *out, ConfigError *err)
{
    if (!n.IsMap())
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: must be a mapping").arg(where));

    Identity id;
    QString encoded;
    bool haveAlias = false;
    bool haveKey = false;

    for (auto it = n.begin(); it != n.end(); ++it) {
        const QString key = qs(it->first.as<std::string>());

        if (key == "alias") {
            if (!scalarString(it->second, where, key, &id.alias, err)) return false;
            haveAlias = true;
        } else if (key == "public_key") {
            if (!scalarString(it->second, where, key, &encoded, err)) return false;
            haveKey = true;
        } else if (key == "active") {
            if (!scalarBool(it->second, where, key, &id.active, err)) return false;
        } else {
            id.extra.insert(key, yamlToVariant(it->second));
        }
    }

    if (!haveAlias)
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: missing required key 'alias'").arg(where));
    if (!haveKey)
        return failWith(err, ErrorCode::MalformedDocument, tr("%1: missing required key 'public_key'").arg(where));

    ConfigError keyErr;
    if (!KeyMaterialGenerator::decodePublicKey(encoded, &id.curve, &id.publicKey, &keyErr))
        return failWith(err, ErrorCode::MalformedDocument, QString("%1: %2").arg(where, keyErr.message));

    id.address = KeyMaterialGenerator::deriveAddress(id.curve, id.publicKey);
    if (id.address.isEmpty())
        return failWith(err, ErrorCode::EntropyUnavailable,
                        tr("%1: could not derive address (libsodium unavailable)").arg(where));

    *out = id;
    return true;
}

// =====================================================
// ClientConfigAdapter
// =====================================================
bool ClientConfigAdapter::parse(const QByteArray &bytes, ConfigDocument *out, ConfigError *err) const
{
    ConfigDocument doc;
    doc.format = DocumentFormat::ClientYaml;

    try {
        const YAML::Node root = YAML::Load(bytes.toStdString());

        if (root.IsNull())
            return failWith(err, ErrorCode::MalformedDocument, tr("Invalid YAML: document is empty"));
        if (!root.IsMap())
            return failWith(err, ErrorCode::MalformedDocument, tr("Invalid YAML: top level must be a mapping"));

        bool haveEnvs = false;

        for (auto it = root.begin(); it != root.end(); ++it) {
            const QString key = qs(it->first.as<std::string>());
            const YAML::Node &value = it->second;

            if (key == "envs") {
                if (!value.IsSequence())
                    return failWith(err, ErrorCode::MalformedDocument, tr("'envs' must be a sequence"));

                QSet<QString> seen;
                for (std::size_t i = 0; i < value.size(); ++i) {
                    const QString where = QString("envs[%1]").arg(i);
                    Profile p;
                    if (!envFromYaml(value[i], where, &p, err)) return false;
                    if (seen.contains(p.name))
                        return failWith(err, ErrorCode::MalformedDocument,
                                        tr("%1: duplicate environment alias '%2'").arg(where, p.name));
                    seen.insert(p.name);
                    doc.client.environments.push_back(p);
                }
                haveEnvs = true;
            } else if (key == "keystore") {
                if (value.IsNull())
                    continue;
                if (!value.IsSequence())
                    return failWith(err, ErrorCode::MalformedDocument, tr("'keystore' must be a sequence"));

                QSet<QString> seen;
                for (std::size_t i = 0; i < value.size(); ++i) {
                    const QString where = QString("keystore[%1]").arg(i);
                    Identity id;
                    if (!keyFromYaml(value[i], where, &id, err)) return false;
                    if (seen.contains(id.alias))
                        return failWith(err, ErrorCode::MalformedDocument,
                                        tr("%1: duplicate key alias '%2'").arg(where, id.alias));
                    seen.insert(id.alias);
                    doc.client.keys.push_back(id);
                }
            } else {
                doc.client.extra.insert(key, yamlToVariant(value));
            }
        }

        if (!haveEnvs)
            return failWith(err, ErrorCode::MalformedDocument, tr("missing required key 'envs'"));

    } catch (const YAML::Exception &e) {
        return failWith(err, ErrorCode::MalformedDocument, tr("Invalid YAML: %1").arg(qs(e.what())));
    }

    if (ActiveSelection::normalize(doc))
        qInfo() << "Client config had inconsistent active flags; normalized on load";

    *out = doc;
    if (err) err->clear();
    return true;
}

bool ClientConfigAdapter::serialize(const ConfigDocument &doc, QByteArray *out, ConfigError *err) const
{
    if (!doc.isClient())
        return failWith(err, ErrorCode::UnsupportedCommand,
                        tr("A primary document cannot be written in the client schema"));

    try {
        YAML::Node root(YAML::NodeType::Map);

        YAML::Node envs(YAML::NodeType::Sequence);
        for (const auto &p : doc.client.environments) {
            YAML::Node e(YAML::NodeType::Map);
            e["alias"] = p.name.toStdString();
            e["rpc"] = p.rpcUrl.toStdString();
            e["active"] = p.active;
            appendExtra(e, p.extra);
            envs.push_back(e);
        }
        root["envs"] = envs;

        YAML::Node keys(YAML::NodeType::Sequence);
        for (const auto &id : doc.client.keys) {
            YAML::Node k(YAML::NodeType::Map);
            k["alias"] = id.alias.toStdString();
            k["public_key"] = KeyMaterialGenerator::encodePublicKey(id.curve, id.publicKey).toStdString();
            k["active"] = id.active;
            appendExtra(k, id.extra);
            keys.push_back(k);
        }
        root["keystore"] = keys;

        appendExtra(root, doc.client.extra);

        YAML::Emitter emitter;
        emitter << root;
        if (!emitter.good())
            return failWith(err, ErrorCode::Io, tr("YAML emitter error: %1").arg(qs(emitter.GetLastError())));

        *out = QByteArray(emitter.c_str(), static_cast<int>(emitter.size())) + "\n";
    } catch (const YAML::Exception &e) {
        return failWith(err, ErrorCode::Io, tr("YAML emitter error: %1").arg(qs(e.what())));
    }

    if (err) err->clear();
    return true;
}
