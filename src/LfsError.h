#ifndef LFSERROR_H
#define LFSERROR_H

#include <QString>

namespace LfsServe {

enum class LfsErrorCode {
    NoError = 0,
    NotFound = 1,
    HashCollisionOrCorruption = 2,
    ReadOnlyViolation = 3,
    TransferTimeout = 4,
    Transfer = 5,
    Protocol = 6,
    RepositoryNotFound = 7,
    TooLarge = 8,
    Io = 9,
    Offline = 10
};

inline int toInt(LfsErrorCode code)
{
    return static_cast<int>(code);
}

//Maps a Monad error code to the HTTP status the transfer layer answers with
int httpStatusForError(int errorCode);

//Timed out transfers, the only failures a client retries with the same oid
bool isRetryableError(int errorCode);

QString errorCodeName(int errorCode);

} // namespace LfsServe

#endif // LFSERROR_H
