#pragma once
//
// DocumentController.h
//
// PURPOSE
// -------
// Owns the single open ConfigDocument and is the only object a presentation
// layer (CLI today, screens later) talks to.
//
// ARCHITECTURAL POSITION
// ----------------------
//   [ presentation: main.cpp CLI / future UI ]
//           ↓ newDocument / load / save / saveAs / reload / apply / beginEdit
//   [ DocumentController ]   <-- this class
//           ↓                          ↓
//   [ ConfigFormatAdapter ]    [ MutationEngine / EditSession ]
//           ↓                          ↓
//   [            ConfigDocument (canonical model)            ]
//
// RESPONSIBILITIES
// ----------------
// - file I/O (QFile read, QSaveFile atomic write) around the byte-only adapters
// - format dispatch by extension / content
// - tracked path, modified flag
// - audit events + log lines for every document operation
// - refuse load/new/save/apply while an EditSession is open on the document
//
// NON-RESPONSIBILITIES
// --------------------
// - no validation of its own (MutationEngine does it)
// - no settings access (callers pass NewDocumentDefaults)
//
// THREADING
// ---------
// GUI/main thread only. Everything is synchronous.
//

#include <QObject>
#include <QString>
#include <QVector>

#include "ConfigError.h"
#include "ConfigModel.h"
#include "MutationEngine.h"

class EditSession;

// Seed values for newDocument().
struct NewDocumentDefaults {
    QString  groupName   = "user";
    QString  profileName = "devnet";
    QString  rpcUrl      = "https://fullnode.devnet.sui.io:443";
    QString  graphqlUrl;            // optional
    QString  grpcUrl;               // optional
    QString  alias       = "main";
    KeyCurve curve       = KeyCurve::Ed25519;

    // Primary only: extra groups with devnet/testnet/mainnet profiles and
    // their own identity, one for GraphQL and one for gRPC endpoints.
    bool     setupGraphql     = false;
    bool     setupGrpc        = false;
    QString  graphqlGroupName = "sui_gql_config";
    QString  grpcGroupName    = "sui_grpc_config";
};

class DocumentController : public QObject
{
    Q_OBJECT
public:
    explicit DocumentController(QObject *parent = nullptr);
    ~DocumentController() override;

    void setNewDocumentDefaults(const NewDocumentDefaults &defaults) { m_defaults = defaults; }
    NewDocumentDefaults newDocumentDefaults() const { return m_defaults; }

    // One group/profile/identity (primary) or one environment/key (client),
    // all active, plus the transport groups the defaults ask for. No path
    // yet; the document counts as modified.
    bool newDocument(DocumentFormat format, ConfigError *err = nullptr);

    // AddIdentity changes of the last newDocument(), recovery phrases included.
    const QVector<AppliedChange> &seededIdentities() const { return m_seeded; }

    // Always reads the file again, never reuses cached state.
    bool load(const QString &path, ConfigError *err = nullptr);

    // NoPathSet if the document was never saved or loaded.
    bool save(ConfigError *err = nullptr);

    // Writes to `path`; the tracked path follows only on success. A primary
    // document written to *.json / *.toml takes that encoding.
    bool saveAs(const QString &path, ConfigError *err = nullptr);

    // Re-parses the tracked path, dropping in-memory changes.
    bool reload(ConfigError *err = nullptr);

    MutationResult apply(const MutationCommand &cmd);

    // Opens `session` on the current document. Commits through the session
    // update the modified flag, the audit trail and emit documentChanged().
    // Destroying the controller closes the session; its commits then fail
    // with SessionClosed.
    bool beginEdit(EditSession *session, ConfigError *err = nullptr);

    bool hasDocument() const { return m_hasDocument; }
    const ConfigDocument &document() const { return m_doc; }
    bool isModified() const { return m_modified; }
    QString filePath() const { return m_doc.filePath; }
    bool isEditing() const;

signals:
    void documentReplaced();
    void documentChanged(const AppliedChange &change);
    void documentSaved(const QString &path);

private:
    bool checkIdle(const QString &operation, ConfigError *err) const;
    bool readDocument(const QString &path, ConfigDocument *out, ConfigError *err) const;
    bool writeDocument(const ConfigDocument &doc, const QString &path, ConfigError *err) const;
    void onMutationResult(const MutationResult &r);
    void replaceDocument(const ConfigDocument &doc, bool modified);

private:
    ConfigDocument      m_doc;
    bool                m_hasDocument = false;
    bool                m_modified    = false;
    NewDocumentDefaults m_defaults;
    QVector<AppliedChange> m_seeded;
};
