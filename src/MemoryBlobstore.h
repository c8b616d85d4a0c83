#ifndef MEMORYBLOBSTORE_H
#define MEMORYBLOBSTORE_H

#include "Blobstore.h"

#include <QHash>
#include <QReadWriteLock>

namespace LfsServe {

class MemoryBlobstore : public Blobstore
{
public:
    MemoryBlobstore() = default;

    Monad::Result<QByteArray> get(const QString& key) const override;
    Monad::ResultBase put(const QString& key, const QByteArray& value) override;
    bool isPresent(const QString& key) const override;
    Monad::Result<qint64> size(const QString& key) const override;

    int count() const;

private:
    mutable QReadWriteLock mLock;
    QHash<QString, QByteArray> mBlobs;
};

} // namespace LfsServe

#endif // MEMORYBLOBSTORE_H
