// DocumentController.cpp
//
// Every public operation follows the same shape:
//
//   1) preconditions (document present, no open edit session)
//   2) work on a local ConfigDocument
//   3) on success: swap into m_doc, update flags, audit, emit
//      on failure: m_doc untouched, audit failure, qWarning
//
// Writes go through QSaveFile so a failed save never truncates the
// existing file.

#include "DocumentController.h"

#include "AuditLogger.h"
#include "ConfigFormatAdapter.h"
#include "EditSession.h"
#include "PrimaryConfigAdapter.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QPointer>
#include <QSaveFile>

static QString tr(const char *s)
{
    return QCoreApplication::translate("DocumentController", s);
}

static QJsonObject docFields(const ConfigDocument &doc)
{
    QJsonObject f;
    f.insert("format", formatToString(doc.format));
    if (!doc.filePath.isEmpty())
        f.insert("path", doc.filePath);
    return f;
}

static void auditFailure(const QString &event, const ConfigError &e, QJsonObject fields = QJsonObject())
{
    if (!e.path.isEmpty() && !fields.contains("path"))
        fields.insert("path", e.path);
    AuditLogger::writeFailure(event, errorCodeName(e.code), e.message, fields);
}

DocumentController::DocumentController(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<AppliedChange>("AppliedChange");
}

DocumentController::~DocumentController()
{
    // A session may still point at m_doc.
    EditSession::releaseDocument(&m_doc);
}

bool DocumentController::isEditing() const
{
    return m_hasDocument && EditSession::isOpenOn(&m_doc);
}

bool DocumentController::checkIdle(const QString &operation, ConfigError *err) const
{
    if (!isEditing()) return true;
    return failWith(err, ErrorCode::SessionAlreadyOpen,
                    tr("Cannot %1 while an edit session is open").arg(operation));
}

void DocumentController::replaceDocument(const ConfigDocument &doc, bool modified)
{
    m_doc = doc;
    m_hasDocument = true;
    m_modified = modified;
    emit documentReplaced();
}

// =====================================================
// File I/O
// =====================================================
bool DocumentController::readDocument(const QString &path, ConfigDocument *out, ConfigError *err) const
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return failWith(err, ErrorCode::Io,
                        tr("Could not open %1: %2").arg(path, f.errorString()), path);

    const QByteArray data = f.readAll();
    f.close();

    const DocumentFormat format = ConfigFormatAdapter::formatForPath(path, data);
    const auto adapter = ConfigFormatAdapter::forFormat(format);

    ConfigError e;
    ConfigDocument doc;
    if (!adapter->parse(data, &doc, &e))
        return failWith(err, e.code, e.message, path);

    doc.filePath = path;
    *out = doc;
    if (err) err->clear();
    return true;
}

bool DocumentController::writeDocument(const ConfigDocument &doc, const QString &path, ConfigError *err) const
{
    const auto adapter = ConfigFormatAdapter::forFormat(doc.format);

    ConfigError e;
    QByteArray bytes;
    if (!adapter->serialize(doc, &bytes, &e))
        return failWith(err, e.code, e.message, path);

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return failWith(err, ErrorCode::Io,
                        tr("Could not write %1: %2").arg(path, f.errorString()), path);

    if (f.write(bytes) != bytes.size()) {
        const QString reason = f.errorString();
        f.cancelWriting();
        return failWith(err, ErrorCode::Io, tr("Could not write %1: %2").arg(path, reason), path);
    }

    if (!f.commit())
        return failWith(err, ErrorCode::Io,
                        tr("Could not write %1: %2").arg(path, f.errorString()), path);

    if (err) err->clear();
    return true;
}

// =====================================================
// Document lifecycle
// =====================================================
// Transport groups newDocument() can add next to the user group, one
// profile per public network.
struct SeedNetwork {
    const char *profile;
    const char *rpcUrl;
    const char *graphqlUrl;
};

static const SeedNetwork kSeedNetworks[] = {
    { "devnet",  "https://fullnode.devnet.sui.io:443",  "https://graphql.devnet.sui.io/graphql" },
    { "testnet", "https://fullnode.testnet.sui.io:443", "https://graphql.testnet.sui.io/graphql" },
    { "mainnet", "https://fullnode.mainnet.sui.io:443", "https://graphql.mainnet.sui.io/graphql" },
};

static MutationResult seedTransportGroup(ConfigDocument &doc, const QString &group, bool graphql,
                                         const NewDocumentDefaults &d, QVector<AppliedChange> *seeded)
{
    MutationResult r = MutationEngine::addGroup(doc, group, false);

    for (const SeedNetwork &n : kSeedNetworks) {
        if (!r.ok) return r;
        const QString rpc = QString::fromLatin1(n.rpcUrl);
        // devnet, the first entry, is the active profile
        r = MutationEngine::addProfile(doc, group, QString::fromLatin1(n.profile), rpc,
                                       graphql ? QString::fromLatin1(n.graphqlUrl) : QString(),
                                       graphql ? QString() : rpc,
                                       &n == kSeedNetworks);
    }

    if (r.ok) {
        r = MutationEngine::addIdentity(doc, group, d.alias, d.curve, true);
        if (r.ok) *seeded << r.change;
    }
    return r;
}

bool DocumentController::newDocument(DocumentFormat format, ConfigError *err)
{
    if (!checkIdle(tr("create a document"), err)) return false;

    ConfigDocument doc;
    doc.format = format;

    const bool client = doc.isClient();
    const QString scope = client ? QString() : m_defaults.groupName;
    QVector<AppliedChange> seeded;

    if (!client)
        doc.primary.version = PrimaryConfigAdapter::currentVersion();

    MutationResult r;
    r.ok = true;

    if (!client)
        r = MutationEngine::addGroup(doc, m_defaults.groupName, true);

    if (r.ok)
        r = MutationEngine::addProfile(doc, scope, m_defaults.profileName, m_defaults.rpcUrl,
                                       client ? QString() : m_defaults.graphqlUrl,
                                       client ? QString() : m_defaults.grpcUrl,
                                       true);
    if (r.ok) {
        r = MutationEngine::addIdentity(doc, scope, m_defaults.alias, m_defaults.curve, true);
        if (r.ok) seeded << r.change;
    }

    if (r.ok && !client && m_defaults.setupGraphql)
        r = seedTransportGroup(doc, m_defaults.graphqlGroupName, true, m_defaults, &seeded);
    if (r.ok && !client && m_defaults.setupGrpc)
        r = seedTransportGroup(doc, m_defaults.grpcGroupName, false, m_defaults, &seeded);

    if (!r.ok) {
        qWarning().noquote() << "New document failed:" << r.error.message;
        auditFailure("document.new", r.error, docFields(doc));
        if (err) *err = r.error;
        return false;
    }

    replaceDocument(doc, true);
    m_seeded = seeded;

    qInfo().noquote() << QString("New %1 document created").arg(formatToString(format));
    AuditLogger::writeEvent("document.new", docFields(m_doc));

    if (err) err->clear();
    return true;
}

bool DocumentController::load(const QString &path, ConfigError *err)
{
    if (!checkIdle(tr("load a document"), err)) return false;

    ConfigError e;
    ConfigDocument doc;
    if (!readDocument(path, &doc, &e)) {
        qWarning().noquote() << "Load failed:" << e.toString();
        auditFailure("document.load", e);
        if (err) *err = e;
        return false;
    }

    replaceDocument(doc, false);

    qInfo().noquote() << QString("Loaded %1 (%2)").arg(path, formatToString(doc.format));
    AuditLogger::writeEvent("document.load", docFields(m_doc));

    if (err) err->clear();
    return true;
}

bool DocumentController::save(ConfigError *err)
{
    if (!m_hasDocument)
        return failWith(err, ErrorCode::NoDocument, tr("No document is open"));
    if (!checkIdle(tr("save"), err)) return false;

    if (m_doc.filePath.isEmpty())
        return failWith(err, ErrorCode::NoPathSet,
                        tr("The document has no file yet; use save-as"));

    ConfigError e;
    if (!writeDocument(m_doc, m_doc.filePath, &e)) {
        qWarning().noquote() << "Save failed:" << e.toString();
        auditFailure("document.save", e, docFields(m_doc));
        if (err) *err = e;
        return false;
    }

    m_modified = false;

    qInfo().noquote() << "Saved" << m_doc.filePath;
    AuditLogger::writeEvent("document.save", docFields(m_doc));
    emit documentSaved(m_doc.filePath);

    if (err) err->clear();
    return true;
}

bool DocumentController::saveAs(const QString &path, ConfigError *err)
{
    if (!m_hasDocument)
        return failWith(err, ErrorCode::NoDocument, tr("No document is open"));
    if (!checkIdle(tr("save"), err)) return false;

    if (path.trimmed().isEmpty())
        return failWith(err, ErrorCode::NoPathSet, tr("No target file given"));

    ConfigDocument target = m_doc;

    // load() picks the adapter by extension, so the extension has to name
    // the document's own schema or the file could not be opened again.
    DocumentFormat byExt = target.format;
    if (ConfigFormatAdapter::formatForExtension(path, &byExt)) {
        if (isPrimaryFormat(byExt) == target.isClient()) {
            ConfigError e;
            failWith(&e, ErrorCode::ExtensionMismatch,
                     tr("%1 is a %2 file name; a %3 document cannot be saved there")
                         .arg(path, formatToString(byExt), formatToString(target.format)),
                     path);
            qWarning().noquote() << "Save as refused:" << e.toString();
            auditFailure("document.save", e, docFields(target));
            if (err) *err = e;
            return false;
        }
        target.format = byExt;
    }

    ConfigError e;
    if (!writeDocument(target, path, &e)) {
        qWarning().noquote() << "Save as failed:" << e.toString();
        auditFailure("document.save", e, docFields(target));
        if (err) *err = e;
        return false;
    }

    const QString previousPath = m_doc.filePath;
    target.filePath = path;
    m_doc = target;
    m_modified = false;

    qInfo().noquote() << QString("Saved as %1 (%2)").arg(path, formatToString(m_doc.format));

    QJsonObject f = docFields(m_doc);
    if (!previousPath.isEmpty())
        f.insert("previous_path", previousPath);
    AuditLogger::writeEvent("document.save", f);

    emit documentSaved(path);

    if (err) err->clear();
    return true;
}

bool DocumentController::reload(ConfigError *err)
{
    if (!m_hasDocument)
        return failWith(err, ErrorCode::NoDocument, tr("No document is open"));
    if (m_doc.filePath.isEmpty())
        return failWith(err, ErrorCode::NoPathSet, tr("The document has never been saved"));

    return load(m_doc.filePath, err);
}

// =====================================================
// Mutations
// =====================================================
void DocumentController::onMutationResult(const MutationResult &r)
{
    QJsonObject f = docFields(m_doc);
    f.insert("command", mutationKindName(r.change.kind));
    f.insert("scope", r.change.scope);
    f.insert("subject", r.change.subject);

    if (!r.ok) {
        auditFailure("document.mutate", r.error, f);
        return;
    }

    if (!r.change.previous.isEmpty()) f.insert("previous", r.change.previous);
    if (!r.change.promoted.isEmpty()) f.insert("promoted", r.change.promoted);
    if (!r.change.derivationPath.isEmpty()) f.insert("derivation_path", r.change.derivationPath);

    m_modified = true;
    AuditLogger::writeEvent("document.mutate", f);

    if (!r.change.promoted.isEmpty())
        qInfo().noquote() << QString("'%1' is now active").arg(r.change.promoted);

    emit documentChanged(r.change);
}

MutationResult DocumentController::apply(const MutationCommand &cmd)
{
    MutationResult r;
    r.change.kind = cmd.kind;
    r.change.scope = cmd.scope;
    r.change.subject = cmd.subject;

    if (!m_hasDocument) {
        failWith(&r.error, ErrorCode::NoDocument, tr("No document is open"));
        return r;
    }
    if (!checkIdle(tr("apply a change"), &r.error))
        return r;

    r = MutationEngine::apply(m_doc, cmd);
    onMutationResult(r);
    return r;
}

bool DocumentController::beginEdit(EditSession *session, ConfigError *err)
{
    if (!m_hasDocument)
        return failWith(err, ErrorCode::NoDocument, tr("No document is open"));
    if (!session)
        return failWith(err, ErrorCode::SessionClosed, tr("No edit session given"));

    if (!session->begin(m_doc, err))
        return false;

    QPointer<DocumentController> self(this);
    session->setCommitHook([self](const MutationResult &r) {
        if (self) self->onMutationResult(r);
    });
    return true;
}
