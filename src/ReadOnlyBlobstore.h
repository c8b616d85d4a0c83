#ifndef READONLYBLOBSTORE_H
#define READONLYBLOBSTORE_H

#include "Blobstore.h"

namespace LfsServe {

//Wraps a blobstore so that every put fails with ReadOnlyPut("<key>")
class ReadOnlyBlobstore : public Blobstore
{
public:
    explicit ReadOnlyBlobstore(BlobstorePtr inner);

    Monad::Result<QByteArray> get(const QString& key) const override;
    Monad::ResultBase put(const QString& key, const QByteArray& value) override;
    bool isPresent(const QString& key) const override;
    Monad::Result<qint64> size(const QString& key) const override;

    bool isReadOnly() const override { return true; }

    static QString readOnlyPutMessage(const QString& key);

private:
    BlobstorePtr mInner;
};

} // namespace LfsServe

#endif // READONLYBLOBSTORE_H
