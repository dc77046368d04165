#pragma once

#include <QString>

//
// ConfigError.h
//
// Error value shared by every chaincfg core component.
//
// Core functions follow one shape:
//
//     bool doSomething(..., ConfigError* err = nullptr);
//
// - return true  -> success, *err is cleared
// - return false -> failure, *err carries code + human readable message
//
// Nothing in the core throws across its API and nothing terminates the
// process. The caller (CLI or a presentation layer) decides how to show it.
//

enum class ErrorCode {
    None,

    // Validation (mutation engine)
    DuplicateName,
    NotFound,
    WouldEmptyRequiredCollection,
    InvalidUrl,
    InvalidAlias,
    InvalidName,
    UnsupportedCommand,

    // Key generation
    UnsupportedCurve,
    EntropyUnavailable,
    InvalidKeyParameters,   // word count, recovery phrase or derivation path

    // Load
    MalformedDocument,
    UnsupportedVersion,

    // Load / save
    Io,
    NoPathSet,
    ExtensionMismatch,  // file name belongs to the other schema

    // Edit session
    SessionAlreadyOpen,
    NoCommandStaged,
    SessionClosed,

    // Controller used before a document exists
    NoDocument,

    // A model post-condition failed after a command was applied
    InternalInvariant
};

enum class ErrorCategory {
    None,
    Validation,
    KeyGeneration,
    Load,
    Save,
    Io,
    Session,
    Controller,
    Internal
};

struct ConfigError {
    ErrorCode code = ErrorCode::None;
    QString   message;
    QString   path;     // file involved in a load/save failure (may be empty)

    bool isError() const { return code != ErrorCode::None; }
    void clear() { code = ErrorCode::None; message.clear(); path.clear(); }

    // "<message> (<path>)" when a path is known.
    QString toString() const;
};

ErrorCategory errorCategory(ErrorCode code);
QString errorCodeName(ErrorCode code);      // "DuplicateName", "Io", ...
QString errorCategoryName(ErrorCategory c); // "validation", "load", ...

// Fills *err (when non-null) and returns false, so callers can write
//     return failWith(err, ErrorCode::NotFound, tr("..."));
bool failWith(ConfigError* err, ErrorCode code, const QString& message,
              const QString& path = QString());
