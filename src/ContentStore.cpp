#include "ContentStore.h"
#include "LfsError.h"
#include "ReadOnlyBlobstore.h"

#include <QDebug>
#include <QMutexLocker>

namespace LfsServe {

ContentStore::ContentStore(BlobstorePtr blobstore)
    : mBlobstore(std::move(blobstore))
{
}

bool ContentStore::isReadOnly() const
{
    return mBlobstore->isReadOnly();
}

QString ContentStore::blobKey(const QString& oid)
{
    return QStringLiteral("content.sha256.") + oid;
}

QMutex* ContentStore::lockFor(const QString& oid)
{
    bool ok = false;
    const int prefix = oid.left(2).toInt(&ok, 16);
    return &mLocks[static_cast<size_t>(ok ? prefix % LockShardCount : 0)];
}

Monad::ResultBase ContentStore::put(const QString& oid, qint64 size, const QByteArray& bytes)
{
    const QString key = blobKey(oid);

    //Read-only storage rejects every write, including ones that would be no-ops
    if (isReadOnly()) {
        qWarning() << "[ContentStore] write rejected, storage is read-only" << key;
        return Monad::ResultBase(ReadOnlyBlobstore::readOnlyPutMessage(key),
                                 toInt(LfsErrorCode::ReadOnlyViolation));
    }

    if (!LfsObject::isValidOid(oid) || size < 0) {
        return Monad::ResultBase(QStringLiteral("Invalid LFS object %1/%2").arg(oid).arg(size),
                                 toInt(LfsErrorCode::Protocol));
    }

    QMutexLocker locker(lockFor(oid));

    if (mBlobstore->isPresent(key)) {
        const auto storedSize = mBlobstore->size(key);
        if (storedSize.hasError()) {
            return Monad::ResultBase(storedSize.errorMessage(), storedSize.errorCode());
        }
        if (storedSize.value() != size) {
            qWarning() << "[ContentStore] size mismatch for stored object" << oid
                       << "stored=" << storedSize.value() << "requested=" << size;
            return Monad::ResultBase(QStringLiteral("Object %1 is stored with size %2, not %3")
                                         .arg(oid)
                                         .arg(storedSize.value())
                                         .arg(size),
                                     toInt(LfsErrorCode::HashCollisionOrCorruption));
        }
        qDebug() << "[ContentStore] already stored" << oid;
        return Monad::ResultBase();
    }

    if (bytes.size() != size) {
        return Monad::ResultBase(QStringLiteral("Object %1 declared %2 bytes but %3 were supplied")
                                     .arg(oid)
                                     .arg(size)
                                     .arg(bytes.size()),
                                 toInt(LfsErrorCode::HashCollisionOrCorruption));
    }

    const QString actualOid = LfsObject::sha256Hex(bytes);
    if (actualOid != oid) {
        return Monad::ResultBase(QStringLiteral("Object hash mismatch: expected %1, got %2")
                                     .arg(oid, actualOid),
                                 toInt(LfsErrorCode::HashCollisionOrCorruption));
    }

    return mBlobstore->put(key, bytes);
}

Monad::Result<LfsObject> ContentStore::storeBytes(const QByteArray& bytes)
{
    const LfsObject object = LfsObject::fromData(bytes);
    const auto result = put(object.oid, object.size, bytes);
    if (result.hasError()) {
        return Monad::Result<LfsObject>(result.errorMessage(), result.errorCode());
    }
    return Monad::Result<LfsObject>(object);
}

Monad::Result<QByteArray> ContentStore::get(const QString& oid) const
{
    if (!LfsObject::isValidOid(oid)) {
        return Monad::Result<QByteArray>(QStringLiteral("Invalid LFS oid: %1").arg(oid),
                                         toInt(LfsErrorCode::NotFound));
    }

    const auto bytes = mBlobstore->get(blobKey(oid));
    if (bytes.hasError()) {
        return bytes;
    }

    const QString actualOid = LfsObject::sha256Hex(bytes.value());
    if (actualOid != oid) {
        qWarning() << "[ContentStore] stored object is corrupt" << oid << "hashes to" << actualOid;
        return Monad::Result<QByteArray>(QStringLiteral("Stored object %1 is corrupt, its bytes hash to %2")
                                             .arg(oid, actualOid),
                                         toInt(LfsErrorCode::HashCollisionOrCorruption));
    }
    return bytes;
}

bool ContentStore::has(const QString& oid) const
{
    return LfsObject::isValidOid(oid) && mBlobstore->isPresent(blobKey(oid));
}

Monad::Result<qint64> ContentStore::size(const QString& oid) const
{
    if (!LfsObject::isValidOid(oid)) {
        return Monad::Result<qint64>(QStringLiteral("Invalid LFS oid: %1").arg(oid),
                                     toInt(LfsErrorCode::NotFound));
    }
    return mBlobstore->size(blobKey(oid));
}

} // namespace LfsServe
