#ifndef BLOBSTORE_H
#define BLOBSTORE_H

#include <QByteArray>
#include <QString>

#include <memory>

#include "Monad/Result.h"

namespace LfsServe {

/**
 * Key/value persistence for opaque byte blobs.
 *
 * Implementations must be safe to call from several worker threads at once.
 * A put replaces the value of an existing key; callers that need put-if-absent
 * semantics serialize on the key themselves (see ContentStore).
 */
class Blobstore
{
public:
    virtual ~Blobstore() = default;

    virtual Monad::Result<QByteArray> get(const QString& key) const = 0;
    virtual Monad::ResultBase put(const QString& key, const QByteArray& value) = 0;
    virtual bool isPresent(const QString& key) const = 0;
    virtual Monad::Result<qint64> size(const QString& key) const = 0;

    virtual bool isReadOnly() const { return false; }
};

using BlobstorePtr = std::shared_ptr<Blobstore>;

} // namespace LfsServe

#endif // BLOBSTORE_H
