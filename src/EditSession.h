#pragma once
//
// EditSession.h
//
// Scoped, cancelable wrapper around a single mutation command.
//
//   EditSession s;
//   if (!s.begin(doc, &err)) ...          // SessionAlreadyOpen if doc is busy
//   s.stage(MutationCommand::...);        // may be re-staged until commit
//   MutationResult r = s.commit();        // applies via MutationEngine, closes
//   // or s.discard();                     // applies nothing, closes
//
// Leaving scope with the session still open discards it.
//
// One open session per document: the registry of open sessions is
// process-wide, keyed by the document's address. The session does not own
// the document. An owner that destroys a document while a session may still
// be open on it calls releaseDocument() first.
//

#include <functional>
#include <utility>

#include "ConfigError.h"
#include "ConfigModel.h"
#include "MutationEngine.h"

class EditSession
{
public:
    using CommitHook = std::function<void(const MutationResult &)>;

    EditSession() = default;
    ~EditSession();

    EditSession(const EditSession &) = delete;
    EditSession &operator=(const EditSession &) = delete;

    bool begin(ConfigDocument &doc, ConfigError *err = nullptr);

    // SessionClosed when not open. Replaces any previously staged command.
    bool stage(const MutationCommand &cmd, ConfigError *err = nullptr);

    // NoCommandStaged / SessionClosed (session state unchanged), or the
    // MutationEngine result. Once the engine ran the session is closed,
    // whether the command succeeded or not.
    MutationResult commit();

    void discard();

    bool isOpen() const { return m_doc != nullptr; }
    bool hasStagedCommand() const { return m_hasStaged; }

    // Receives the engine result of every commit that reached the engine.
    // DocumentController uses it for the modified flag and the audit trail.
    void setCommitHook(CommitHook hook) { m_hook = std::move(hook); }

    static bool isOpenOn(const ConfigDocument *doc);

    // Closes the session open on `doc`, if any, and drops its commit hook.
    // Later commits through that session fail with SessionClosed.
    static void releaseDocument(const ConfigDocument *doc);

private:
    void close();

    ConfigDocument *m_doc = nullptr;
    MutationCommand m_staged;
    bool m_hasStaged = false;
    CommitHook m_hook;
};
