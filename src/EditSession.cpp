#include "EditSession.h"

#include <QCoreApplication>
#include <QDebug>
#include <QHash>

static QString tr(const char *s)
{
    return QCoreApplication::translate("EditSession", s);
}

// Document -> session open on it. Single-threaded by contract (see DocumentController).
static QHash<const ConfigDocument*, EditSession*> &openDocuments()
{
    static QHash<const ConfigDocument*, EditSession*> s;
    return s;
}

EditSession::~EditSession()
{
    if (isOpen()) {
        qDebug() << "Edit session destroyed while open; discarding";
        discard();
    }
}

bool EditSession::isOpenOn(const ConfigDocument *doc)
{
    return doc && openDocuments().contains(doc);
}

bool EditSession::begin(ConfigDocument &doc, ConfigError *err)
{
    if (isOpen() || isOpenOn(&doc))
        return failWith(err, ErrorCode::SessionAlreadyOpen,
                        tr("An edit session is already open on this document"));

    openDocuments().insert(&doc, this);
    m_doc = &doc;
    m_hasStaged = false;

    if (err) err->clear();
    return true;
}

bool EditSession::stage(const MutationCommand &cmd, ConfigError *err)
{
    if (!isOpen())
        return failWith(err, ErrorCode::SessionClosed, tr("The edit session is closed"));

    m_staged = cmd;
    m_hasStaged = true;

    if (err) err->clear();
    return true;
}

MutationResult EditSession::commit()
{
    MutationResult r;

    if (!isOpen()) {
        failWith(&r.error, ErrorCode::SessionClosed, tr("The edit session is closed"));
        return r;
    }

    if (!m_hasStaged) {
        failWith(&r.error, ErrorCode::NoCommandStaged, tr("Nothing to commit: no command staged"));
        return r;
    }

    ConfigDocument *doc = m_doc;
    const MutationCommand cmd = m_staged;

    // Release the document first so a hook may start the next session.
    close();

    r = MutationEngine::apply(*doc, cmd);
    if (m_hook)
        m_hook(r);

    return r;
}

void EditSession::discard()
{
    close();
}

void EditSession::releaseDocument(const ConfigDocument *doc)
{
    EditSession *session = openDocuments().value(doc, nullptr);
    if (!session)
        return;

    qDebug() << "Document released while an edit session was open; closing it";
    session->close();
    session->m_hook = nullptr;
}

void EditSession::close()
{
    if (m_doc)
        openDocuments().remove(m_doc);
    m_doc = nullptr;
    m_hasStaged = false;
}
