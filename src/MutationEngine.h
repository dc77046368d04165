#pragma once
//
// MutationEngine.h
//
// PURPOSE
// -------
// The only code path that changes a ConfigDocument after it was created.
//
// Each operation is a MutationCommand (data) applied by apply():
//
//   1) copy the document
//   2) validate + execute the command on the copy
//        - scope exists, subject exists
//        - name / alias / URL syntax
//        - uniqueness within the scope
//        - deletes do not empty a required collection
//        - addIdentity: key generation (KeyMaterialGenerator)
//   3) ActiveSelection::normalize() on the copy   (promotion after delete, etc.)
//   4) ActiveSelection::holds() on the copy
//   5) swap the copy in
//
// Any failure before step 5 leaves the caller's document untouched.
//
// Scope
// -----
// Profile and identity commands take a `scope`:
//   - Primary document: the owning group's name
//   - Client document:  "" (environments / keystore of the document itself)
// Group commands on a client document fail with UnsupportedCommand.
//
// Required collections (deletes only)
// -----------------------------------
//   Primary: >= 1 group, and per group >= 1 profile and >= 1 identity
//   Client:  >= 1 environment (the keystore may become empty)
//

#include <QMetaType>
#include <QString>

#include "ConfigError.h"
#include "ConfigModel.h"

enum class MutationKind {
    AddGroup,
    RenameGroup,
    SetGroupActive,
    DeleteGroup,

    AddProfile,
    EditProfileField,
    SetProfileActive,
    DeleteProfile,

    AddIdentity,
    EditIdentityAlias,
    SetIdentityActive,
    DeleteIdentity
};

// "add-group", "rename-identity", ... (audit / log tag)
QString mutationKindName(MutationKind kind);

enum class ProfileField {
    Name,
    RpcUrl,
    GraphqlUrl,
    GrpcUrl
};

// "name", "rpc_url", "graphql_url", "grpc_url"
QString profileFieldName(ProfileField field);
bool profileFieldFromString(const QString &s, ProfileField *out);

struct MutationCommand {
    MutationKind kind = MutationKind::AddGroup;

    QString scope;        // owning group (Primary) or "" (Client); unused by group commands
    QString subject;      // name/alias acted on; the old name for renames
    QString value;        // new name, rpc url, or field value

    QString graphqlUrl;   // AddProfile only
    QString grpcUrl;      // AddProfile only

    ProfileField field = ProfileField::Name;
    KeyCurve curve = KeyCurve::Ed25519;
    int wordCount = 12;          // AddIdentity only
    QString derivationPath;      // AddIdentity only; empty means the curve's default
    bool makeActive = false;

    static MutationCommand addGroup(const QString &name, bool makeActive = false);
    static MutationCommand renameGroup(const QString &oldName, const QString &newName);
    static MutationCommand setGroupActive(const QString &name);
    static MutationCommand deleteGroup(const QString &name);

    static MutationCommand addProfile(const QString &scope, const QString &name,
                                      const QString &rpcUrl,
                                      const QString &graphqlUrl = QString(),
                                      const QString &grpcUrl = QString(),
                                      bool makeActive = false);
    static MutationCommand editProfileField(const QString &scope, const QString &name,
                                            ProfileField field, const QString &value);
    static MutationCommand setProfileActive(const QString &scope, const QString &name);
    static MutationCommand deleteProfile(const QString &scope, const QString &name);

    static MutationCommand addIdentity(const QString &scope, const QString &alias,
                                       KeyCurve curve = KeyCurve::Ed25519,
                                       bool makeActive = false,
                                       int wordCount = 12,
                                       const QString &derivationPath = QString());
    static MutationCommand editIdentityAlias(const QString &scope, const QString &oldAlias,
                                             const QString &newAlias);
    static MutationCommand setIdentityActive(const QString &scope, const QString &alias);
    static MutationCommand deleteIdentity(const QString &scope, const QString &alias);
};

// What a command did (or, on failure, was asked to do), for signals, audit and logs.
struct AppliedChange {
    MutationKind kind = MutationKind::AddGroup;
    QString scope;
    QString subject;     // entity name after the command
    QString previous;    // old name / old field value (renames and edits)
    QString promoted;    // member made active because the active one was deleted

    // AddIdentity: how to restore the new key. Never stored in the document,
    // never logged or audited.
    QString recoveryPhrase;
    QString derivationPath;
};

Q_DECLARE_METATYPE(AppliedChange)

struct MutationResult {
    bool ok = false;
    ConfigError error;
    AppliedChange change;
};

class MutationEngine
{
public:
    static MutationResult apply(ConfigDocument &doc, const MutationCommand &cmd);

    // Convenience wrappers: build the command and apply() it.
    static MutationResult addGroup(ConfigDocument &doc, const QString &name, bool makeActive = false);
    static MutationResult renameGroup(ConfigDocument &doc, const QString &oldName, const QString &newName);
    static MutationResult setGroupActive(ConfigDocument &doc, const QString &name);
    static MutationResult deleteGroup(ConfigDocument &doc, const QString &name);

    static MutationResult addProfile(ConfigDocument &doc, const QString &scope, const QString &name,
                                     const QString &rpcUrl, const QString &graphqlUrl = QString(),
                                     const QString &grpcUrl = QString(), bool makeActive = false);
    static MutationResult editProfileField(ConfigDocument &doc, const QString &scope, const QString &name,
                                           ProfileField field, const QString &value);
    static MutationResult setProfileActive(ConfigDocument &doc, const QString &scope, const QString &name);
    static MutationResult deleteProfile(ConfigDocument &doc, const QString &scope, const QString &name);

    static MutationResult addIdentity(ConfigDocument &doc, const QString &scope, const QString &alias,
                                      KeyCurve curve = KeyCurve::Ed25519, bool makeActive = false,
                                      int wordCount = 12, const QString &derivationPath = QString());
    static MutationResult editIdentityAlias(ConfigDocument &doc, const QString &scope,
                                            const QString &oldAlias, const QString &newAlias);
    static MutationResult setIdentityActive(ConfigDocument &doc, const QString &scope, const QString &alias);
    static MutationResult deleteIdentity(ConfigDocument &doc, const QString &scope, const QString &alias);

    // Syntax rules used by the commands.
    //   names:   ^[a-zA-Z_-]{3,32}$
    //   aliases: 3..64 chars, no whitespace or control characters
    //   urls:    absolute http/https/ws/wss/grpc/grpcs with a host
    static bool validateName(const QString &name, ConfigError *err = nullptr);
    static bool validateAlias(const QString &alias, ConfigError *err = nullptr);
    static bool validateUrl(const QString &url, ConfigError *err = nullptr);
};
