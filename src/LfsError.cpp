#include "LfsError.h"

namespace LfsServe {

int httpStatusForError(int errorCode)
{
    switch (static_cast<LfsErrorCode>(errorCode)) {
    case LfsErrorCode::NoError:
        return 200;
    case LfsErrorCode::NotFound:
    case LfsErrorCode::RepositoryNotFound:
        return 404;
    case LfsErrorCode::HashCollisionOrCorruption:
        return 409;
    case LfsErrorCode::ReadOnlyViolation:
        return 403;
    case LfsErrorCode::TooLarge:
        return 413;
    case LfsErrorCode::Protocol:
        return 422;
    case LfsErrorCode::TransferTimeout:
        return 504;
    case LfsErrorCode::Transfer:
    case LfsErrorCode::Offline:
        return 502;
    case LfsErrorCode::Io:
        return 500;
    }
    return 500;
}

bool isRetryableError(int errorCode)
{
    return static_cast<LfsErrorCode>(errorCode) == LfsErrorCode::TransferTimeout;
}

QString errorCodeName(int errorCode)
{
    switch (static_cast<LfsErrorCode>(errorCode)) {
    case LfsErrorCode::NoError:
        return QStringLiteral("NoError");
    case LfsErrorCode::NotFound:
        return QStringLiteral("NotFound");
    case LfsErrorCode::HashCollisionOrCorruption:
        return QStringLiteral("HashCollisionOrCorruption");
    case LfsErrorCode::ReadOnlyViolation:
        return QStringLiteral("ReadOnlyViolation");
    case LfsErrorCode::TransferTimeout:
        return QStringLiteral("TransferTimeout");
    case LfsErrorCode::Transfer:
        return QStringLiteral("Transfer");
    case LfsErrorCode::Protocol:
        return QStringLiteral("Protocol");
    case LfsErrorCode::RepositoryNotFound:
        return QStringLiteral("RepositoryNotFound");
    case LfsErrorCode::TooLarge:
        return QStringLiteral("TooLarge");
    case LfsErrorCode::Io:
        return QStringLiteral("Io");
    case LfsErrorCode::Offline:
        return QStringLiteral("Offline");
    }
    return QStringLiteral("Unknown(%1)").arg(errorCode);
}

} // namespace LfsServe
