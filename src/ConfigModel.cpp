#include "ConfigModel.h"

#include <QCoreApplication>

static QString tr(const char *s)
{
    return QCoreApplication::translate("ConfigModel", s);
}

// -----------------------------
// Group
// -----------------------------
int Group::profileIndex(const QString &name) const
{
    for (int i = 0; i < profiles.size(); ++i)
        if (profiles[i].name == name) return i;
    return -1;
}

int Group::identityIndex(const QString &alias) const
{
    for (int i = 0; i < identities.size(); ++i)
        if (identities[i].alias == alias) return i;
    return -1;
}

QStringList Group::profileNames() const
{
    QStringList out;
    for (const auto &p : profiles) out << p.name;
    return out;
}

QStringList Group::aliases() const
{
    QStringList out;
    for (const auto &i : identities) out << i.alias;
    return out;
}

const Profile *Group::activeProfile() const
{
    for (const auto &p : profiles)
        if (p.active) return &p;
    return nullptr;
}

const Identity *Group::activeIdentity() const
{
    for (const auto &i : identities)
        if (i.active) return &i;
    return nullptr;
}

// -----------------------------
// PrimaryDocument
// -----------------------------
int PrimaryDocument::groupIndex(const QString &name) const
{
    for (int i = 0; i < groups.size(); ++i)
        if (groups[i].name == name) return i;
    return -1;
}

QStringList PrimaryDocument::groupNames() const
{
    QStringList out;
    for (const auto &g : groups) out << g.name;
    return out;
}

const Group *PrimaryDocument::activeGroup() const
{
    for (const auto &g : groups)
        if (g.active) return &g;
    return nullptr;
}

Group *PrimaryDocument::findGroup(const QString &name, ConfigError *err)
{
    const int idx = groupIndex(name);
    if (idx < 0) {
        failWith(err, ErrorCode::NotFound, tr("Group '%1' not found").arg(name));
        return nullptr;
    }
    if (err) err->clear();
    return &groups[idx];
}

const Group *PrimaryDocument::findGroup(const QString &name, ConfigError *err) const
{
    const int idx = groupIndex(name);
    if (idx < 0) {
        failWith(err, ErrorCode::NotFound, tr("Group '%1' not found").arg(name));
        return nullptr;
    }
    if (err) err->clear();
    return &groups[idx];
}

const Profile *PrimaryDocument::findProfile(const QString &group, const QString &name,
                                            ConfigError *err) const
{
    const Group *g = findGroup(group, err);
    if (!g) return nullptr;

    const int idx = g->profileIndex(name);
    if (idx < 0) {
        failWith(err, ErrorCode::NotFound,
                 tr("Profile '%1' not found in group '%2'").arg(name, group));
        return nullptr;
    }
    return &g->profiles[idx];
}

// -----------------------------
// ConfigDocument scope resolution
// -----------------------------
static bool clientScopeOk(const QString &scope, ConfigError *err)
{
    if (scope.isEmpty()) return true;
    return failWith(err, ErrorCode::NotFound,
                    tr("Client documents have no groups (scope '%1')").arg(scope));
}

QVector<Profile> *ConfigDocument::profilesIn(const QString &scope, ConfigError *err)
{
    if (isClient())
        return clientScopeOk(scope, err) ? &client.environments : nullptr;

    Group *g = primary.findGroup(scope, err);
    return g ? &g->profiles : nullptr;
}

const QVector<Profile> *ConfigDocument::profilesIn(const QString &scope, ConfigError *err) const
{
    if (isClient())
        return clientScopeOk(scope, err) ? &client.environments : nullptr;

    const Group *g = primary.findGroup(scope, err);
    return g ? &g->profiles : nullptr;
}

QVector<Identity> *ConfigDocument::identitiesIn(const QString &scope, ConfigError *err)
{
    if (isClient())
        return clientScopeOk(scope, err) ? &client.keys : nullptr;

    Group *g = primary.findGroup(scope, err);
    return g ? &g->identities : nullptr;
}

const QVector<Identity> *ConfigDocument::identitiesIn(const QString &scope, ConfigError *err) const
{
    if (isClient())
        return clientScopeOk(scope, err) ? &client.keys : nullptr;

    const Group *g = primary.findGroup(scope, err);
    return g ? &g->identities : nullptr;
}

const Profile *ConfigDocument::findProfile(const QString &scope, const QString &name,
                                           ConfigError *err) const
{
    const QVector<Profile> *list = profilesIn(scope, err);
    if (!list) return nullptr;

    for (const auto &p : *list)
        if (p.name == name) return &p;

    failWith(err, ErrorCode::NotFound,
             isClient() ? tr("Environment '%1' not found").arg(name)
                        : tr("Profile '%1' not found in group '%2'").arg(name, scope));
    return nullptr;
}

const Identity *ConfigDocument::findIdentity(const QString &scope, const QString &alias,
                                             ConfigError *err) const
{
    const QVector<Identity> *list = identitiesIn(scope, err);
    if (!list) return nullptr;

    for (const auto &i : *list)
        if (i.alias == alias) return &i;

    failWith(err, ErrorCode::NotFound,
             isClient() ? tr("Key '%1' not found").arg(alias)
                        : tr("Identity '%1' not found in group '%2'").arg(alias, scope));
    return nullptr;
}

QString ConfigDocument::activeScope() const
{
    if (isClient()) return QString();
    const Group *g = primary.activeGroup();
    return g ? g->name : QString();
}

// -----------------------------
// Equality
// -----------------------------
bool operator==(const Identity &a, const Identity &b)
{
    return a.alias == b.alias
        && a.publicKey == b.publicKey
        && a.curve == b.curve
        && a.address == b.address
        && a.active == b.active
        && a.extra == b.extra;
}

bool operator==(const Profile &a, const Profile &b)
{
    return a.name == b.name
        && a.rpcUrl == b.rpcUrl
        && a.graphqlUrl == b.graphqlUrl
        && a.grpcUrl == b.grpcUrl
        && a.active == b.active
        && a.extra == b.extra;
}

bool operator==(const Group &a, const Group &b)
{
    return a.name == b.name
        && a.active == b.active
        && a.profiles == b.profiles
        && a.identities == b.identities
        && a.extra == b.extra;
}

bool operator==(const PrimaryDocument &a, const PrimaryDocument &b)
{
    return a.version == b.version
        && a.groups == b.groups
        && a.extra == b.extra;
}

bool operator==(const ClientDocument &a, const ClientDocument &b)
{
    return a.environments == b.environments
        && a.keys == b.keys
        && a.extra == b.extra;
}

bool operator==(const ConfigDocument &a, const ConfigDocument &b)
{
    if (a.format != b.format) return false;
    return a.isClient() ? a.client == b.client : a.primary == b.primary;
}
