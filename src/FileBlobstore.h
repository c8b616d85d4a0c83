#ifndef FILEBLOBSTORE_H
#define FILEBLOBSTORE_H

#include "Blobstore.h"

namespace LfsServe {

/**
 * Stores each blob as one file under rootPath/blobs/<aa>/<bb>/<key>, where
 * aa and bb are taken from the SHA-256 of the key so that directories stay
 * small. A blob is written to a temporary file next to its final path and
 * renamed into place, so it is either complete or absent. An existing blob is
 * never replaced: put() of a key that is already on disk keeps the stored
 * bytes and succeeds, even when another instance on the same root wrote it.
 */
class FileBlobstore : public Blobstore
{
public:
    explicit FileBlobstore(QString rootPath);

    const QString& rootPath() const { return mRootPath; }

    Monad::Result<QByteArray> get(const QString& key) const override;
    Monad::ResultBase put(const QString& key, const QByteArray& value) override;
    bool isPresent(const QString& key) const override;
    Monad::Result<qint64> size(const QString& key) const override;

    static bool isValidKey(const QString& key);
    static QString blobPath(const QString& rootPath, const QString& key);

private:
    QString mRootPath;
};

} // namespace LfsServe

#endif // FILEBLOBSTORE_H
