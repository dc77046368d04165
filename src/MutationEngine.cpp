// MutationEngine.cpp
//
// Commands are executed on a working copy of the document (see header).
// The per-command functions below only validate and perform the structural
// change; active flags beyond an explicit setActive() are left to the shared
// ActiveSelection::normalize() pass in apply().

#include "MutationEngine.h"

#include "ActiveSelection.h"
#include "KeyMaterialGenerator.h"

#include <QCoreApplication>
#include <QDebug>
#include <QRegularExpression>
#include <QUrl>

static QString tr(const char *s)
{
    return QCoreApplication::translate("MutationEngine", s);
}

// =====================================================
// Names
// =====================================================
QString mutationKindName(MutationKind kind)
{
    switch (kind) {
        case MutationKind::AddGroup:          return "add-group";
        case MutationKind::RenameGroup:       return "rename-group";
        case MutationKind::SetGroupActive:    return "activate-group";
        case MutationKind::DeleteGroup:       return "delete-group";
        case MutationKind::AddProfile:        return "add-profile";
        case MutationKind::EditProfileField:  return "set-profile";
        case MutationKind::SetProfileActive:  return "activate-profile";
        case MutationKind::DeleteProfile:     return "delete-profile";
        case MutationKind::AddIdentity:       return "add-identity";
        case MutationKind::EditIdentityAlias: return "rename-identity";
        case MutationKind::SetIdentityActive: return "activate-identity";
        case MutationKind::DeleteIdentity:    return "delete-identity";
    }
    return "unknown";
}

QString profileFieldName(ProfileField field)
{
    switch (field) {
        case ProfileField::Name:       return "name";
        case ProfileField::RpcUrl:     return "rpc_url";
        case ProfileField::GraphqlUrl: return "graphql_url";
        case ProfileField::GrpcUrl:    return "grpc_url";
    }
    return "name";
}

bool profileFieldFromString(const QString &s, ProfileField *out)
{
    const QString v = s.trimmed().toLower().replace('-', '_');
    if (v == "name")                         { *out = ProfileField::Name;       return true; }
    if (v == "rpc_url" || v == "url")        { *out = ProfileField::RpcUrl;     return true; }
    if (v == "graphql_url" || v == "graphql") { *out = ProfileField::GraphqlUrl; return true; }
    if (v == "grpc_url" || v == "grpc")      { *out = ProfileField::GrpcUrl;    return true; }
    return false;
}

// =====================================================
// Command factories
// =====================================================
MutationCommand MutationCommand::addGroup(const QString &name, bool makeActive)
{
    MutationCommand c;
    c.kind = MutationKind::AddGroup;
    c.subject = name;
    c.makeActive = makeActive;
    return c;
}

MutationCommand MutationCommand::renameGroup(const QString &oldName, const QString &newName)
{
    MutationCommand c;
    c.kind = MutationKind::RenameGroup;
    c.subject = oldName;
    c.value = newName;
    return c;
}

MutationCommand MutationCommand::setGroupActive(const QString &name)
{
    MutationCommand c;
    c.kind = MutationKind::SetGroupActive;
    c.subject = name;
    return c;
}

MutationCommand MutationCommand::deleteGroup(const QString &name)
{
    MutationCommand c;
    c.kind = MutationKind::DeleteGroup;
    c.subject = name;
    return c;
}

MutationCommand MutationCommand::addProfile(const QString &scope, const QString &name,
                                            const QString &rpcUrl, const QString &graphqlUrl,
                                            const QString &grpcUrl, bool makeActive)
{
    MutationCommand c;
    c.kind = MutationKind::AddProfile;
    c.scope = scope;
    c.subject = name;
    c.value = rpcUrl;
    c.graphqlUrl = graphqlUrl;
    c.grpcUrl = grpcUrl;
    c.makeActive = makeActive;
    return c;
}

MutationCommand MutationCommand::editProfileField(const QString &scope, const QString &name,
                                                  ProfileField field, const QString &value)
{
    MutationCommand c;
    c.kind = MutationKind::EditProfileField;
    c.scope = scope;
    c.subject = name;
    c.field = field;
    c.value = value;
    return c;
}

MutationCommand MutationCommand::setProfileActive(const QString &scope, const QString &name)
{
    MutationCommand c;
    c.kind = MutationKind::SetProfileActive;
    c.scope = scope;
    c.subject = name;
    return c;
}

MutationCommand MutationCommand::deleteProfile(const QString &scope, const QString &name)
{
    MutationCommand c;
    c.kind = MutationKind::DeleteProfile;
    c.scope = scope;
    c.subject = name;
    return c;
}

MutationCommand MutationCommand::addIdentity(const QString &scope, const QString &alias,
                                             KeyCurve curve, bool makeActive,
                                             int wordCount, const QString &derivationPath)
{
    MutationCommand c;
    c.kind = MutationKind::AddIdentity;
    c.scope = scope;
    c.subject = alias;
    c.curve = curve;
    c.wordCount = wordCount;
    c.derivationPath = derivationPath;
    c.makeActive = makeActive;
    return c;
}

MutationCommand MutationCommand::editIdentityAlias(const QString &scope, const QString &oldAlias,
                                                   const QString &newAlias)
{
    MutationCommand c;
    c.kind = MutationKind::EditIdentityAlias;
    c.scope = scope;
    c.subject = oldAlias;
    c.value = newAlias;
    return c;
}

MutationCommand MutationCommand::setIdentityActive(const QString &scope, const QString &alias)
{
    MutationCommand c;
    c.kind = MutationKind::SetIdentityActive;
    c.scope = scope;
    c.subject = alias;
    return c;
}

MutationCommand MutationCommand::deleteIdentity(const QString &scope, const QString &alias)
{
    MutationCommand c;
    c.kind = MutationKind::DeleteIdentity;
    c.scope = scope;
    c.subject = alias;
    return c;
}

// =====================================================
// Validation
// =====================================================
bool MutationEngine::validateName(const QString &name, ConfigError *err)
{
    static const QRegularExpression re("^[a-zA-Z_-]{3,32}$");
    if (!re.match(name).hasMatch())
        return failWith(err, ErrorCode::InvalidName,
                        tr("Invalid name '%1': use 3-32 letters, '_' or '-'").arg(name));
    return true;
}

bool MutationEngine::validateAlias(const QString &alias, ConfigError *err)
{
    if (alias.size() < 3 || alias.size() > 64)
        return failWith(err, ErrorCode::InvalidAlias,
                        tr("Invalid alias '%1': must be 3-64 characters").arg(alias));

    for (const QChar c : alias) {
        if (c.isSpace() || c.category() == QChar::Other_Control)
            return failWith(err, ErrorCode::InvalidAlias,
                            tr("Invalid alias '%1': whitespace and control characters are not allowed")
                                .arg(alias));
    }
    return true;
}

bool MutationEngine::validateUrl(const QString &url, ConfigError *err)
{
    static const QStringList schemes = { "http", "https", "ws", "wss", "grpc", "grpcs" };

    const QUrl u(url, QUrl::StrictMode);
    if (url.trimmed() != url || !u.isValid() || u.isRelative())
        return failWith(err, ErrorCode::InvalidUrl, tr("Invalid URL '%1'").arg(url));

    if (!schemes.contains(u.scheme().toLower()))
        return failWith(err, ErrorCode::InvalidUrl,
                        tr("Invalid URL '%1': scheme must be one of %2")
                            .arg(url, schemes.join(", ")));

    if (u.host().isEmpty())
        return failWith(err, ErrorCode::InvalidUrl, tr("Invalid URL '%1': missing host").arg(url));

    return true;
}

// =====================================================
// Collection helpers (Profile keyed by name, Identity by alias)
// =====================================================
static const QString &keyOf(const Profile &p)  { return p.name; }
static const QString &keyOf(const Identity &i) { return i.alias; }

template <typename T>
static int indexOfKey(const QVector<T> &items, const QString &key)
{
    for (int i = 0; i < items.size(); ++i)
        if (keyOf(items[i]) == key) return i;
    return -1;
}

static QString profileLabel(const ConfigDocument &doc)  { return doc.isClient() ? tr("Environment") : tr("Profile"); }
static QString identityLabel(const ConfigDocument &doc) { return doc.isClient() ? tr("Key") : tr("Identity"); }

static QString whereLabel(const ConfigDocument &doc, const QString &scope)
{
    return doc.isClient() ? tr("this document") : tr("group '%1'").arg(scope);
}

// Per-command bookkeeping that apply() finishes after normalize().
struct Step {
    AppliedChange change;
    bool removedActive = false;
};

static bool requirePrimary(const ConfigDocument &doc, MutationKind kind, ConfigError *err)
{
    if (!doc.isClient()) return true;
    return failWith(err, ErrorCode::UnsupportedCommand,
                    tr("'%1' is not available for client documents (they have no groups)")
                        .arg(mutationKindName(kind)));
}

// =====================================================
// Group commands
// =====================================================
static bool doAddGroup(ConfigDocument &doc, const MutationCommand &cmd, Step *, ConfigError *err)
{
    if (!requirePrimary(doc, cmd.kind, err)) return false;
    if (!MutationEngine::validateName(cmd.subject, err)) return false;

    if (doc.primary.groupIndex(cmd.subject) >= 0)
        return failWith(err, ErrorCode::DuplicateName,
                        tr("Group '%1' already exists").arg(cmd.subject));

    Group g;
    g.name = cmd.subject;
    doc.primary.groups.push_back(g);

    if (cmd.makeActive)
        ActiveSelection::setActive(doc.primary.groups, doc.primary.groups.size() - 1);
    return true;
}

static bool doRenameGroup(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    if (!requirePrimary(doc, cmd.kind, err)) return false;

    Group *g = doc.primary.findGroup(cmd.subject, err);
    if (!g) return false;

    step->change.previous = cmd.subject;
    step->change.subject = cmd.value;
    if (cmd.value == cmd.subject) return true;

    if (!MutationEngine::validateName(cmd.value, err)) return false;
    if (doc.primary.groupIndex(cmd.value) >= 0)
        return failWith(err, ErrorCode::DuplicateName,
                        tr("Group '%1' already exists").arg(cmd.value));

    g->name = cmd.value;
    return true;
}

static bool doSetGroupActive(ConfigDocument &doc, const MutationCommand &cmd, Step *, ConfigError *err)
{
    if (!requirePrimary(doc, cmd.kind, err)) return false;
    if (!doc.primary.findGroup(cmd.subject, err)) return false;

    ActiveSelection::setActive(doc.primary.groups, doc.primary.groupIndex(cmd.subject));
    return true;
}

static bool doDeleteGroup(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    if (!requirePrimary(doc, cmd.kind, err)) return false;

    const Group *g = doc.primary.findGroup(cmd.subject, err);
    if (!g) return false;

    if (doc.primary.groups.size() <= 1)
        return failWith(err, ErrorCode::WouldEmptyRequiredCollection,
                        tr("Cannot delete group '%1': a document needs at least one group")
                            .arg(cmd.subject));

    step->removedActive = g->active;

    // Profiles and identities are owned by value and go with the group.
    doc.primary.groups.remove(doc.primary.groupIndex(cmd.subject));
    return true;
}

// =====================================================
// Profile commands
// =====================================================
static bool doAddProfile(ConfigDocument &doc, const MutationCommand &cmd, Step *, ConfigError *err)
{
    QVector<Profile> *profiles = doc.profilesIn(cmd.scope, err);
    if (!profiles) return false;

    if (doc.isClient() && (!cmd.graphqlUrl.isEmpty() || !cmd.grpcUrl.isEmpty()))
        return failWith(err, ErrorCode::UnsupportedCommand,
                        tr("Client environments have no GraphQL or gRPC endpoints"));

    if (!MutationEngine::validateName(cmd.subject, err)) return false;
    if (!MutationEngine::validateUrl(cmd.value, err)) return false;
    if (!cmd.graphqlUrl.isEmpty() && !MutationEngine::validateUrl(cmd.graphqlUrl, err)) return false;
    if (!cmd.grpcUrl.isEmpty() && !MutationEngine::validateUrl(cmd.grpcUrl, err)) return false;

    if (indexOfKey(*profiles, cmd.subject) >= 0)
        return failWith(err, ErrorCode::DuplicateName,
                        tr("%1 '%2' already exists in %3")
                            .arg(profileLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    Profile p;
    p.name = cmd.subject;
    p.rpcUrl = cmd.value;
    p.graphqlUrl = cmd.graphqlUrl;
    p.grpcUrl = cmd.grpcUrl;
    profiles->push_back(p);

    if (cmd.makeActive)
        ActiveSelection::setActive(*profiles, profiles->size() - 1);
    return true;
}

static bool doEditProfileField(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    QVector<Profile> *profiles = doc.profilesIn(cmd.scope, err);
    if (!profiles) return false;

    const int idx = indexOfKey(*profiles, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(profileLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    Profile &p = (*profiles)[idx];
    step->change.subject = p.name;

    switch (cmd.field) {
        case ProfileField::Name:
            step->change.previous = p.name;
            step->change.subject = cmd.value;
            if (cmd.value == p.name) return true;

            if (!MutationEngine::validateName(cmd.value, err)) return false;
            if (indexOfKey(*profiles, cmd.value) >= 0)
                return failWith(err, ErrorCode::DuplicateName,
                                tr("%1 '%2' already exists in %3")
                                    .arg(profileLabel(doc), cmd.value, whereLabel(doc, cmd.scope)));
            p.name = cmd.value;
            return true;

        case ProfileField::RpcUrl:
            if (!MutationEngine::validateUrl(cmd.value, err)) return false;
            step->change.previous = p.rpcUrl;
            p.rpcUrl = cmd.value;
            return true;

        case ProfileField::GraphqlUrl:
        case ProfileField::GrpcUrl: {
            if (doc.isClient())
                return failWith(err, ErrorCode::UnsupportedCommand,
                                tr("Client environments have no GraphQL or gRPC endpoints"));

            // Empty value removes the optional endpoint.
            if (!cmd.value.isEmpty() && !MutationEngine::validateUrl(cmd.value, err)) return false;

            QString &target = (cmd.field == ProfileField::GraphqlUrl) ? p.graphqlUrl : p.grpcUrl;
            step->change.previous = target;
            target = cmd.value;
            return true;
        }
    }
    return true;
}

static bool doSetProfileActive(ConfigDocument &doc, const MutationCommand &cmd, Step *, ConfigError *err)
{
    QVector<Profile> *profiles = doc.profilesIn(cmd.scope, err);
    if (!profiles) return false;

    const int idx = indexOfKey(*profiles, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(profileLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    ActiveSelection::setActive(*profiles, idx);
    return true;
}

static bool doDeleteProfile(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    QVector<Profile> *profiles = doc.profilesIn(cmd.scope, err);
    if (!profiles) return false;

    const int idx = indexOfKey(*profiles, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(profileLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    if (profiles->size() <= 1)
        return failWith(err, ErrorCode::WouldEmptyRequiredCollection,
                        tr("Cannot delete %1 '%2': %3 needs at least one")
                            .arg(profileLabel(doc).toLower(), cmd.subject, whereLabel(doc, cmd.scope)));

    step->removedActive = (*profiles)[idx].active;
    profiles->remove(idx);
    return true;
}

// =====================================================
// Identity commands
// =====================================================
static bool doAddIdentity(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    QVector<Identity> *identities = doc.identitiesIn(cmd.scope, err);
    if (!identities) return false;

    if (!MutationEngine::validateAlias(cmd.subject, err)) return false;

    if (indexOfKey(*identities, cmd.subject) >= 0)
        return failWith(err, ErrorCode::DuplicateName,
                        tr("%1 '%2' already exists in %3")
                            .arg(identityLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    // Last check: nothing is inserted when key generation fails.
    KeyGenOptions options;
    options.wordCount = cmd.wordCount;
    options.derivationPath = cmd.derivationPath;

    KeyMaterial km;
    if (!KeyMaterialGenerator::generate(cmd.curve, options, &km, err)) return false;

    Identity id;
    id.alias = cmd.subject;
    id.publicKey = km.publicKey;
    id.curve = km.curve;
    id.address = km.address;
    identities->push_back(id);

    step->change.recoveryPhrase = km.recoveryPhrase;
    step->change.derivationPath = km.derivationPath;

    if (cmd.makeActive)
        ActiveSelection::setActive(*identities, identities->size() - 1);
    return true;
}

static bool doEditIdentityAlias(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    QVector<Identity> *identities = doc.identitiesIn(cmd.scope, err);
    if (!identities) return false;

    const int idx = indexOfKey(*identities, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(identityLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    step->change.previous = cmd.subject;
    step->change.subject = cmd.value;
    if (cmd.value == cmd.subject) return true;

    if (!MutationEngine::validateAlias(cmd.value, err)) return false;
    if (indexOfKey(*identities, cmd.value) >= 0)
        return failWith(err, ErrorCode::DuplicateName,
                        tr("%1 '%2' already exists in %3")
                            .arg(identityLabel(doc), cmd.value, whereLabel(doc, cmd.scope)));

    (*identities)[idx].alias = cmd.value;
    return true;
}

static bool doSetIdentityActive(ConfigDocument &doc, const MutationCommand &cmd, Step *, ConfigError *err)
{
    QVector<Identity> *identities = doc.identitiesIn(cmd.scope, err);
    if (!identities) return false;

    const int idx = indexOfKey(*identities, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(identityLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    ActiveSelection::setActive(*identities, idx);
    return true;
}

static bool doDeleteIdentity(ConfigDocument &doc, const MutationCommand &cmd, Step *step, ConfigError *err)
{
    QVector<Identity> *identities = doc.identitiesIn(cmd.scope, err);
    if (!identities) return false;

    const int idx = indexOfKey(*identities, cmd.subject);
    if (idx < 0)
        return failWith(err, ErrorCode::NotFound,
                        tr("%1 '%2' not found in %3")
                            .arg(identityLabel(doc), cmd.subject, whereLabel(doc, cmd.scope)));

    // The client keystore may become empty; a group keeps one identity.
    if (!doc.isClient() && identities->size() <= 1)
        return failWith(err, ErrorCode::WouldEmptyRequiredCollection,
                        tr("Cannot delete identity '%1': %2 needs at least one")
                            .arg(cmd.subject, whereLabel(doc, cmd.scope)));

    step->removedActive = (*identities)[idx].active;
    identities->remove(idx);
    return true;
}

// =====================================================
// apply()
// =====================================================
template <typename T>
static QString activeKey(const QVector<T> *items)
{
    if (!items) return QString();
    const int idx = ActiveSelection::activeIndex(*items);
    return idx >= 0 ? keyOf((*items)[idx]) : QString();
}

static QString promotedAfterDelete(const ConfigDocument &doc, const MutationCommand &cmd)
{
    switch (cmd.kind) {
        case MutationKind::DeleteGroup: {
            const Group *g = doc.primary.activeGroup();
            return g ? g->name : QString();
        }
        case MutationKind::DeleteProfile:
            return activeKey(doc.profilesIn(cmd.scope));
        case MutationKind::DeleteIdentity:
            return activeKey(doc.identitiesIn(cmd.scope));
        default:
            break;
    }
    return QString();
}

MutationResult MutationEngine::apply(ConfigDocument &doc, const MutationCommand &cmd)
{
    MutationResult r;

    ConfigDocument work = doc;

    Step step;
    step.change.kind = cmd.kind;
    step.change.scope = cmd.scope;
    step.change.subject = cmd.subject;

    bool ok = false;
    switch (cmd.kind) {
        case MutationKind::AddGroup:          ok = doAddGroup(work, cmd, &step, &r.error); break;
        case MutationKind::RenameGroup:       ok = doRenameGroup(work, cmd, &step, &r.error); break;
        case MutationKind::SetGroupActive:    ok = doSetGroupActive(work, cmd, &step, &r.error); break;
        case MutationKind::DeleteGroup:       ok = doDeleteGroup(work, cmd, &step, &r.error); break;
        case MutationKind::AddProfile:        ok = doAddProfile(work, cmd, &step, &r.error); break;
        case MutationKind::EditProfileField:  ok = doEditProfileField(work, cmd, &step, &r.error); break;
        case MutationKind::SetProfileActive:  ok = doSetProfileActive(work, cmd, &step, &r.error); break;
        case MutationKind::DeleteProfile:     ok = doDeleteProfile(work, cmd, &step, &r.error); break;
        case MutationKind::AddIdentity:       ok = doAddIdentity(work, cmd, &step, &r.error); break;
        case MutationKind::EditIdentityAlias: ok = doEditIdentityAlias(work, cmd, &step, &r.error); break;
        case MutationKind::SetIdentityActive: ok = doSetIdentityActive(work, cmd, &step, &r.error); break;
        case MutationKind::DeleteIdentity:    ok = doDeleteIdentity(work, cmd, &step, &r.error); break;
    }

    if (!ok) {
        r.change.kind = cmd.kind;
        r.change.scope = cmd.scope;
        r.change.subject = cmd.subject;
        qWarning().noquote() << QString("Mutation %1 '%2' rejected: %3")
                                    .arg(mutationKindName(cmd.kind), cmd.subject, r.error.message);
        return r;
    }

    ActiveSelection::normalize(work);

    if (!ActiveSelection::holds(work)) {
        failWith(&r.error, ErrorCode::InternalInvariant,
                 tr("'%1' would leave an ambiguous active selection").arg(mutationKindName(cmd.kind)));
        qCritical().noquote() << r.error.message;
        return r;
    }

    if (step.removedActive)
        step.change.promoted = promotedAfterDelete(work, cmd);

    doc = work;

    r.ok = true;
    r.change = step.change;

    qDebug().noquote() << QString("Mutation %1 applied: scope='%2' subject='%3'")
                              .arg(mutationKindName(cmd.kind), cmd.scope, step.change.subject);
    return r;
}

// =====================================================
// Wrappers
// =====================================================
MutationResult MutationEngine::addGroup(ConfigDocument &doc, const QString &name, bool makeActive)
{
    return apply(doc, MutationCommand::addGroup(name, makeActive));
}

MutationResult MutationEngine::renameGroup(ConfigDocument &doc, const QString &oldName, const QString &newName)
{
    return apply(doc, MutationCommand::renameGroup(oldName, newName));
}

MutationResult MutationEngine::setGroupActive(ConfigDocument &doc, const QString &name)
{
    return apply(doc, MutationCommand::setGroupActive(name));
}

MutationResult MutationEngine::deleteGroup(ConfigDocument &doc, const QString &name)
{
    return apply(doc, MutationCommand::deleteGroup(name));
}

MutationResult MutationEngine::addProfile(ConfigDocument &doc, const QString &scope, const QString &name,
                                          const QString &rpcUrl, const QString &graphqlUrl,
                                          const QString &grpcUrl, bool makeActive)
{
    return apply(doc, MutationCommand::addProfile(scope, name, rpcUrl, graphqlUrl, grpcUrl, makeActive));
}

MutationResult MutationEngine::editProfileField(ConfigDocument &doc, const QString &scope, const QString &name,
                                                ProfileField field, const QString &value)
{
    return apply(doc, MutationCommand::editProfileField(scope, name, field, value));
}

MutationResult MutationEngine::setProfileActive(ConfigDocument &doc, const QString &scope, const QString &name)
{
    return apply(doc, MutationCommand::setProfileActive(scope, name));
}

MutationResult MutationEngine::deleteProfile(ConfigDocument &doc, const QString &scope, const QString &name)
{
    return apply(doc, MutationCommand::deleteProfile(scope, name));
}

MutationResult MutationEngine::addIdentity(ConfigDocument &doc, const QString &scope, const QString &alias,
                                           KeyCurve curve, bool makeActive,
                                           int wordCount, const QString &derivationPath)
{
    return apply(doc, MutationCommand::addIdentity(scope, alias, curve, makeActive,
                                                   wordCount, derivationPath));
}

MutationResult MutationEngine::editIdentityAlias(ConfigDocument &doc, const QString &scope,
                                                 const QString &oldAlias, const QString &newAlias)
{
    return apply(doc, MutationCommand::editIdentityAlias(scope, oldAlias, newAlias));
}

MutationResult MutationEngine::setIdentityActive(ConfigDocument &doc, const QString &scope, const QString &alias)
{
    return apply(doc, MutationCommand::setIdentityActive(scope, alias));
}

MutationResult MutationEngine::deleteIdentity(ConfigDocument &doc, const QString &scope, const QString &alias)
{
    return apply(doc, MutationCommand::deleteIdentity(scope, alias));
}
