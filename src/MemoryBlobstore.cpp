#include "MemoryBlobstore.h"
#include "LfsError.h"

#include <QReadLocker>
#include <QWriteLocker>

namespace LfsServe {

Monad::Result<QByteArray> MemoryBlobstore::get(const QString& key) const
{
    QReadLocker locker(&mLock);
    auto it = mBlobs.constFind(key);
    if (it == mBlobs.constEnd()) {
        return Monad::Result<QByteArray>(QStringLiteral("Blob not found: %1").arg(key),
                                         toInt(LfsErrorCode::NotFound));
    }
    return Monad::Result<QByteArray>(it.value());
}

Monad::ResultBase MemoryBlobstore::put(const QString& key, const QByteArray& value)
{
    if (key.isEmpty()) {
        return Monad::ResultBase(QStringLiteral("Empty blob key"), toInt(LfsErrorCode::Protocol));
    }
    QWriteLocker locker(&mLock);
    mBlobs.insert(key, value);
    return Monad::ResultBase();
}

bool MemoryBlobstore::isPresent(const QString& key) const
{
    QReadLocker locker(&mLock);
    return mBlobs.contains(key);
}

Monad::Result<qint64> MemoryBlobstore::size(const QString& key) const
{
    QReadLocker locker(&mLock);
    auto it = mBlobs.constFind(key);
    if (it == mBlobs.constEnd()) {
        return Monad::Result<qint64>(QStringLiteral("Blob not found: %1").arg(key),
                                     toInt(LfsErrorCode::NotFound));
    }
    return Monad::Result<qint64>(static_cast<qint64>(it.value().size()));
}

int MemoryBlobstore::count() const
{
    QReadLocker locker(&mLock);
    return mBlobs.size();
}

} // namespace LfsServe
