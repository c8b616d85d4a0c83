#include "FileBlobstore.h"
#include "LfsError.h"
#include "LfsObject.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryFile>

namespace {

bool ensureDirForBlobPath(const QString& blobPath)
{
    const QFileInfo info(blobPath);
    const QDir dir(info.absolutePath());
    if (dir.exists()) {
        return true;
    }
    return QDir().mkpath(dir.absolutePath());
}

QString normalizeRootPath(const QString& rootPath)
{
    if (rootPath.isEmpty()) {
        return QString();
    }
    return QDir(rootPath).absolutePath();
}

} // namespace

namespace LfsServe {

FileBlobstore::FileBlobstore(QString rootPath)
    : mRootPath(normalizeRootPath(rootPath))
{
}

bool FileBlobstore::isValidKey(const QString& key)
{
    if (key.isEmpty() || key.startsWith(QLatin1Char('.'))) {
        return false;
    }
    for (QChar ch : key) {
        const bool allowed = (ch >= QLatin1Char('a') && ch <= QLatin1Char('z'))
                             || (ch >= QLatin1Char('A') && ch <= QLatin1Char('Z'))
                             || (ch >= QLatin1Char('0') && ch <= QLatin1Char('9'))
                             || ch == QLatin1Char('.')
                             || ch == QLatin1Char('_')
                             || ch == QLatin1Char('-');
        if (!allowed) {
            return false;
        }
    }
    return true;
}

QString FileBlobstore::blobPath(const QString& rootPath, const QString& key)
{
    if (rootPath.isEmpty() || !isValidKey(key)) {
        return QString();
    }
    const QString keyHash = LfsObject::sha256Hex(key.toUtf8());
    const QString first = keyHash.mid(0, 2);
    const QString second = keyHash.mid(2, 2);
    const QDir blobsDir(QDir(rootPath).filePath(QStringLiteral("blobs")));
    return blobsDir.filePath(first + QLatin1Char('/') + second + QLatin1Char('/') + key);
}

Monad::Result<QByteArray> FileBlobstore::get(const QString& key) const
{
    const QString path = blobPath(mRootPath, key);
    if (path.isEmpty()) {
        return Monad::Result<QByteArray>(QStringLiteral("Invalid blob key: %1").arg(key),
                                         toInt(LfsErrorCode::Protocol));
    }

    QFile file(path);
    if (!file.exists()) {
        return Monad::Result<QByteArray>(QStringLiteral("Blob not found: %1").arg(key),
                                         toInt(LfsErrorCode::NotFound));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<QByteArray>(file.errorString(), toInt(LfsErrorCode::Io));
    }

    return Monad::Result<QByteArray>(file.readAll());
}

Monad::ResultBase FileBlobstore::put(const QString& key, const QByteArray& value)
{
    const QString path = blobPath(mRootPath, key);
    if (path.isEmpty()) {
        return Monad::ResultBase(QStringLiteral("Invalid blob key: %1").arg(key),
                                 toInt(LfsErrorCode::Protocol));
    }

    if (!ensureDirForBlobPath(path)) {
        return Monad::ResultBase(QStringLiteral("Failed to create blob directory"),
                                 toInt(LfsErrorCode::Io));
    }

    //Keys never start with a dot, so an incoming file can't be mistaken for a blob
    QTemporaryFile file(QFileInfo(path).absolutePath() + QStringLiteral("/.incoming-XXXXXX"));
    if (!file.open()) {
        qWarning() << "[FileBlobstore] open failed" << path << file.errorString();
        return Monad::ResultBase(file.errorString(), toInt(LfsErrorCode::Io));
    }
    if (file.write(value) != value.size() || !file.flush()) {
        return Monad::ResultBase(QStringLiteral("Failed to write blob data"), toInt(LfsErrorCode::Io));
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner
                        | QFileDevice::ReadGroup | QFileDevice::ReadOther);
    file.close();

    //rename() refuses to replace an existing file, the first writer of a key wins
    if (!file.rename(path)) {
        if (QFileInfo::exists(path)) {
            qDebug() << "[FileBlobstore] already stored, keeping the existing blob" << key;
            return Monad::ResultBase();
        }
        qWarning() << "[FileBlobstore] rename failed" << path << file.errorString();
        return Monad::ResultBase(QStringLiteral("Failed to commit blob data: %1").arg(file.errorString()),
                                 toInt(LfsErrorCode::Io));
    }

    qDebug() << "[FileBlobstore] stored" << key << "bytes=" << value.size();
    return Monad::ResultBase();
}

bool FileBlobstore::isPresent(const QString& key) const
{
    const QString path = blobPath(mRootPath, key);
    return !path.isEmpty() && QFileInfo::exists(path);
}

Monad::Result<qint64> FileBlobstore::size(const QString& key) const
{
    const QString path = blobPath(mRootPath, key);
    if (path.isEmpty()) {
        return Monad::Result<qint64>(QStringLiteral("Invalid blob key: %1").arg(key),
                                     toInt(LfsErrorCode::Protocol));
    }

    const QFileInfo info(path);
    if (!info.exists()) {
        return Monad::Result<qint64>(QStringLiteral("Blob not found: %1").arg(key),
                                     toInt(LfsErrorCode::NotFound));
    }
    return Monad::Result<qint64>(info.size());
}

} // namespace LfsServe
