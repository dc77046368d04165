#include "ConfigError.h"

QString ConfigError::toString() const
{
    if (path.isEmpty())
        return message;
    return QString("%1 (%2)").arg(message, path);
}

ErrorCategory errorCategory(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None:
            return ErrorCategory::None;

        case ErrorCode::DuplicateName:
        case ErrorCode::NotFound:
        case ErrorCode::WouldEmptyRequiredCollection:
        case ErrorCode::InvalidUrl:
        case ErrorCode::InvalidAlias:
        case ErrorCode::InvalidName:
        case ErrorCode::UnsupportedCommand:
            return ErrorCategory::Validation;

        case ErrorCode::UnsupportedCurve:
        case ErrorCode::EntropyUnavailable:
        case ErrorCode::InvalidKeyParameters:
            return ErrorCategory::KeyGeneration;

        case ErrorCode::MalformedDocument:
        case ErrorCode::UnsupportedVersion:
            return ErrorCategory::Load;

        // Raised by both load and save; path and message say which file.
        case ErrorCode::Io:
            return ErrorCategory::Io;

        case ErrorCode::NoPathSet:
        case ErrorCode::ExtensionMismatch:
            return ErrorCategory::Save;

        case ErrorCode::SessionAlreadyOpen:
        case ErrorCode::NoCommandStaged:
        case ErrorCode::SessionClosed:
            return ErrorCategory::Session;

        case ErrorCode::NoDocument:
            return ErrorCategory::Controller;

        case ErrorCode::InternalInvariant:
            return ErrorCategory::Internal;
    }
    return ErrorCategory::None;
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None:                         return "None";
        case ErrorCode::DuplicateName:                return "DuplicateName";
        case ErrorCode::NotFound:                     return "NotFound";
        case ErrorCode::WouldEmptyRequiredCollection: return "WouldEmptyRequiredCollection";
        case ErrorCode::InvalidUrl:                   return "InvalidUrl";
        case ErrorCode::InvalidAlias:                 return "InvalidAlias";
        case ErrorCode::InvalidName:                  return "InvalidName";
        case ErrorCode::UnsupportedCommand:           return "UnsupportedCommand";
        case ErrorCode::UnsupportedCurve:             return "UnsupportedCurve";
        case ErrorCode::EntropyUnavailable:           return "EntropyUnavailable";
        case ErrorCode::InvalidKeyParameters:         return "InvalidKeyParameters";
        case ErrorCode::MalformedDocument:            return "MalformedDocument";
        case ErrorCode::UnsupportedVersion:           return "UnsupportedVersion";
        case ErrorCode::Io:                           return "Io";
        case ErrorCode::NoPathSet:                    return "NoPathSet";
        case ErrorCode::ExtensionMismatch:            return "ExtensionMismatch";
        case ErrorCode::SessionAlreadyOpen:           return "SessionAlreadyOpen";
        case ErrorCode::NoCommandStaged:              return "NoCommandStaged";
        case ErrorCode::SessionClosed:                return "SessionClosed";
        case ErrorCode::NoDocument:                   return "NoDocument";
        case ErrorCode::InternalInvariant:            return "InternalInvariant";
    }
    return "Unknown";
}

QString errorCategoryName(ErrorCategory c)
{
    switch (c) {
        case ErrorCategory::None:          return "ok";
        case ErrorCategory::Validation:    return "validation";
        case ErrorCategory::KeyGeneration: return "keygen";
        case ErrorCategory::Load:          return "load";
        case ErrorCategory::Save:          return "save";
        case ErrorCategory::Io:            return "io";
        case ErrorCategory::Session:       return "session";
        case ErrorCategory::Controller:    return "controller";
        case ErrorCategory::Internal:      return "internal";
    }
    return "error";
}

bool failWith(ConfigError* err, ErrorCode code, const QString& message, const QString& path)
{
    if (err) {
        err->code = code;
        err->message = message;
        err->path = path;
    }
    return false;
}
