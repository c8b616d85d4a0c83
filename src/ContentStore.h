#ifndef CONTENTSTORE_H
#define CONTENTSTORE_H

#include <QByteArray>
#include <QMutex>
#include <QString>

#include <array>
#include <memory>

#include "Blobstore.h"
#include "LfsObject.h"
#include "Monad/Result.h"

namespace LfsServe {

/**
 * Content-addressed storage on top of a Blobstore.
 *
 * Blobs are keyed by the SHA-256 of their bytes. put() of an oid that is
 * already stored is a no-op as long as the size agrees, so a given oid is
 * physically written once for the lifetime of the store. Puts of the same
 * oid serialize on a lock shard chosen from the oid; other oids proceed in
 * parallel. get() hashes what it reads and reports a mismatch as
 * HashCollisionOrCorruption.
 */
class ContentStore
{
public:
    explicit ContentStore(BlobstorePtr blobstore);

    const BlobstorePtr& blobstore() const { return mBlobstore; }
    bool isReadOnly() const;

    Monad::ResultBase put(const QString& oid, qint64 size, const QByteArray& bytes);
    Monad::Result<LfsObject> storeBytes(const QByteArray& bytes);

    Monad::Result<QByteArray> get(const QString& oid) const;
    bool has(const QString& oid) const;
    Monad::Result<qint64> size(const QString& oid) const;

    static QString blobKey(const QString& oid);

private:
    static constexpr int LockShardCount = 64;

    BlobstorePtr mBlobstore;
    std::array<QMutex, LockShardCount> mLocks;

    QMutex* lockFor(const QString& oid);
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace LfsServe

#endif // CONTENTSTORE_H
