#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>

#include "ConfigError.h"

//
// ConfigModel.h
//
// Canonical in-memory model of a chaincfg document.
//
// Two on-disk schemas map onto it:
//
//   Primary (JSON or TOML):   Groups -> { Profiles, Identities }
//   Client  (YAML):           Environments, Keys   (no groups)
//
// ConfigDocument is a tagged variant: `format` says which half
// (`primary` or `client`) is live. Client environments reuse the Profile
// struct and client keys reuse the Identity struct, so the mutation engine
// handles both schemas with the same collection code.
//
// Groups own their profiles and identities by value. Removing a group is a
// single QVector::remove; nothing else references its children.
//
// This header is pure data plus lookups. No I/O, no validation.
//
// Every entity carries `extra`: keys found on disk that the model does not
// understand. Adapters write them back unchanged on save.
//

// -----------------------------
// Curves
// -----------------------------
enum class KeyCurve {
    Ed25519,
    Secp256k1,
    Secp256r1,
    Unknown
};

static inline QString curveToString(KeyCurve c)
{
    switch (c) {
        case KeyCurve::Ed25519:   return "ed25519";
        case KeyCurve::Secp256k1: return "secp256k1";
        case KeyCurve::Secp256r1: return "secp256r1";
        case KeyCurve::Unknown:   break;
    }
    return "unknown";
}

// Exact (case-insensitive) tag match; anything else is Unknown.
static inline KeyCurve curveFromString(const QString &s)
{
    const QString v = s.trimmed().toLower();
    if (v == "ed25519")   return KeyCurve::Ed25519;
    if (v == "secp256k1") return KeyCurve::Secp256k1;
    if (v == "secp256r1") return KeyCurve::Secp256r1;
    return KeyCurve::Unknown;
}

// -----------------------------
// Formats
// -----------------------------
enum class DocumentFormat {
    PrimaryJson,
    PrimaryToml,
    ClientYaml
};

static inline QString formatToString(DocumentFormat f)
{
    switch (f) {
        case DocumentFormat::PrimaryJson: return "json";
        case DocumentFormat::PrimaryToml: return "toml";
        case DocumentFormat::ClientYaml:  return "yaml";
    }
    return "json";
}

static inline bool formatFromString(const QString &s, DocumentFormat *out)
{
    const QString v = s.trimmed().toLower();
    if (v == "json")                { *out = DocumentFormat::PrimaryJson; return true; }
    if (v == "toml")                { *out = DocumentFormat::PrimaryToml; return true; }
    if (v == "yaml" || v == "yml")  { *out = DocumentFormat::ClientYaml;  return true; }
    return false;
}

static inline bool isPrimaryFormat(DocumentFormat f)
{
    return f != DocumentFormat::ClientYaml;
}

// -----------------------------
// Entities
// -----------------------------
struct Identity {
    QString    alias;
    QByteArray publicKey;                 // raw key bytes, no scheme flag
    KeyCurve   curve = KeyCurve::Ed25519;
    QString    address;                   // "0x" + 64 hex
    bool       active = false;
    QVariantMap extra;
};

struct Profile {
    QString name;
    QString rpcUrl;
    QString graphqlUrl;   // optional (empty = absent)
    QString grpcUrl;      // optional (empty = absent)
    bool    active = false;
    QVariantMap extra;
};

struct Group {
    QString name;
    bool    active = false;
    QVector<Profile>  profiles;
    QVector<Identity> identities;
    QVariantMap extra;

    int profileIndex(const QString &name) const;
    int identityIndex(const QString &alias) const;
    QStringList profileNames() const;
    QStringList aliases() const;
    const Profile  *activeProfile() const;
    const Identity *activeIdentity() const;
};

struct PrimaryDocument {
    QString version;          // empty = marker absent on disk
    QVector<Group> groups;
    QVariantMap extra;

    int groupIndex(const QString &name) const;
    QStringList groupNames() const;
    const Group *activeGroup() const;

    // Lookups fail with NotFound.
    Group       *findGroup(const QString &name, ConfigError *err = nullptr);
    const Group *findGroup(const QString &name, ConfigError *err = nullptr) const;
    const Profile *findProfile(const QString &group, const QString &name,
                               ConfigError *err = nullptr) const;
};

struct ClientDocument {
    QVector<Profile>  environments;
    QVector<Identity> keys;
    QVariantMap extra;
};

struct ConfigDocument {
    DocumentFormat  format = DocumentFormat::PrimaryJson;
    QString         filePath;   // empty until loaded or first saved
    PrimaryDocument primary;
    ClientDocument  client;

    bool isClient() const { return format == DocumentFormat::ClientYaml; }

    // Scope resolution shared by both schemas:
    // - Primary: scope is a group name
    // - Client:  scope must be empty (the document itself)
    QVector<Profile>        *profilesIn(const QString &scope, ConfigError *err = nullptr);
    const QVector<Profile>  *profilesIn(const QString &scope, ConfigError *err = nullptr) const;
    QVector<Identity>       *identitiesIn(const QString &scope, ConfigError *err = nullptr);
    const QVector<Identity> *identitiesIn(const QString &scope, ConfigError *err = nullptr) const;

    const Profile  *findProfile(const QString &scope, const QString &name,
                                ConfigError *err = nullptr) const;
    const Identity *findIdentity(const QString &scope, const QString &alias,
                                 ConfigError *err = nullptr) const;

    // Name of the scope that holds the active selection:
    // the active group (Primary) or "" (Client).
    QString activeScope() const;
};

// Structural equality. ConfigDocument compares format and content; the
// file path is where the document lives, not what it is.
bool operator==(const Identity &a, const Identity &b);
bool operator==(const Profile &a, const Profile &b);
bool operator==(const Group &a, const Group &b);
bool operator==(const PrimaryDocument &a, const PrimaryDocument &b);
bool operator==(const ClientDocument &a, const ClientDocument &b);
bool operator==(const ConfigDocument &a, const ConfigDocument &b);

inline bool operator!=(const ConfigDocument &a, const ConfigDocument &b) { return !(a == b); }
