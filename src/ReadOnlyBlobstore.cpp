#include "ReadOnlyBlobstore.h"
#include "LfsError.h"

#include <QDebug>

namespace LfsServe {

ReadOnlyBlobstore::ReadOnlyBlobstore(BlobstorePtr inner)
    : mInner(std::move(inner))
{
}

Monad::Result<QByteArray> ReadOnlyBlobstore::get(const QString& key) const
{
    return mInner->get(key);
}

Monad::ResultBase ReadOnlyBlobstore::put(const QString& key, const QByteArray& value)
{
    Q_UNUSED(value);
    qWarning() << "[ReadOnlyBlobstore] rejected put" << key;
    return Monad::ResultBase(readOnlyPutMessage(key), toInt(LfsErrorCode::ReadOnlyViolation));
}

bool ReadOnlyBlobstore::isPresent(const QString& key) const
{
    return mInner->isPresent(key);
}

Monad::Result<qint64> ReadOnlyBlobstore::size(const QString& key) const
{
    return mInner->size(key);
}

QString ReadOnlyBlobstore::readOnlyPutMessage(const QString& key)
{
    return QStringLiteral("ReadOnlyPut(\"%1\")").arg(key);
}

} // namespace LfsServe
