//Our includes
#include "RequestLog.h"
#include "LfsError.h"

//Qt includes
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QMutexLocker>

static const QString timestampKey = QStringLiteral("timestamp");
static const QString methodKey = QStringLiteral("method");
static const QString pathKey = QStringLiteral("path");
static const QString repositoryKey = QStringLiteral("repository");
static const QString statusKey = QStringLiteral("status");
static const QString requestBytesKey = QStringLiteral("requestBytes");
static const QString responseBytesKey = QStringLiteral("responseBytes");

using namespace LfsServe;

RequestLogEntry::RequestLogEntry(QByteArray method, QString path, QString repository, int status,
                                 qint64 requestBytes, qint64 responseBytes,
                                 QDateTime timestamp) :
    mTimestamp(std::move(timestamp)),
    mMethod(std::move(method)),
    mPath(std::move(path)),
    mRepository(std::move(repository)),
    mStatus(status),
    mRequestBytes(requestBytes),
    mResponseBytes(responseBytes)
{
}

QVariantMap RequestLogEntry::data() const
{
    return {
        {timestampKey, mTimestamp.toString(Qt::ISODateWithMs)},
        {methodKey, QString::fromLatin1(mMethod)},
        {pathKey, mPath},
        {repositoryKey, mRepository},
        {statusKey, mStatus},
        {requestBytesKey, mRequestBytes},
        {responseBytesKey, mResponseBytes}
    };
}

QString RequestLogEntry::toJsonString() const
{
    auto doc = QJsonDocument::fromVariant(data());
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

RequestLogEntry RequestLogEntry::fromJson(const QString& json)
{
    auto doc = QJsonDocument::fromJson(json.toUtf8());
    auto map = doc.toVariant().toMap();
    return RequestLogEntry(map.value(methodKey).toString().toLatin1(),
                           map.value(pathKey).toString(),
                           map.value(repositoryKey).toString(),
                           map.value(statusKey).toInt(),
                           map.value(requestBytesKey).toLongLong(),
                           map.value(responseBytesKey).toLongLong(),
                           QDateTime::fromString(map.value(timestampKey).toString(), Qt::ISODateWithMs));
}

RequestLog::RequestLog(int capacity) :
    mEntries(qMax(1, capacity))
{
}

int RequestLog::capacity() const
{
    QMutexLocker locker(&mMutex);
    return mEntries.capacity();
}

void RequestLog::setCapacity(int capacity)
{
    QMutexLocker locker(&mMutex);
    mEntries.setCapacity(qMax(1, capacity));
}

Monad::ResultBase RequestLog::setFilePath(const QString& filePath)
{
    if (!filePath.isEmpty()) {
        const QFileInfo info(filePath);
        if (!QDir().mkpath(info.absolutePath())) {
            return Monad::ResultBase(QStringLiteral("Failed to create request log directory %1").arg(info.absolutePath()),
                                     toInt(LfsErrorCode::Io));
        }
        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            return Monad::ResultBase(file.errorString(), toInt(LfsErrorCode::Io));
        }
    }

    QMutexLocker locker(&mMutex);
    mFilePath = filePath;
    return Monad::ResultBase();
}

QString RequestLog::filePath() const
{
    QMutexLocker locker(&mMutex);
    return mFilePath;
}

void RequestLog::append(const RequestLogEntry& entry)
{
    QMutexLocker locker(&mMutex);
    //A full cache drops its oldest entry
    mEntries.append(entry);
    if (!mEntries.areIndexesValid()) {
        mEntries.normalizeIndexes();
    }

    if (mFilePath.isEmpty()) {
        return;
    }

    QFile file(mFilePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qWarning() << "[RequestLog] can't open" << mFilePath << file.errorString();
        return;
    }
    const QByteArray line = entry.toJsonString().toUtf8() + '\n';
    if (file.write(line) != line.size()) {
        qWarning() << "[RequestLog] short write to" << mFilePath;
    }
}

QVector<RequestLogEntry> RequestLog::entries() const
{
    QMutexLocker locker(&mMutex);
    QVector<RequestLogEntry> entries;
    entries.reserve(mEntries.count());
    for (int i = mEntries.firstIndex(); i <= mEntries.lastIndex(); ++i) {
        entries.append(mEntries.at(i));
    }
    return entries;
}

int RequestLog::size() const
{
    QMutexLocker locker(&mMutex);
    return mEntries.count();
}

int RequestLog::count(const QByteArray& method, const QString& pathContains) const
{
    QMutexLocker locker(&mMutex);
    int matches = 0;
    for (int i = mEntries.firstIndex(); i <= mEntries.lastIndex(); ++i) {
        const RequestLogEntry& entry = mEntries.at(i);
        if (entry.method() == method && (pathContains.isEmpty() || entry.path().contains(pathContains))) {
            ++matches;
        }
    }
    return matches;
}

void RequestLog::clear()
{
    QMutexLocker locker(&mMutex);
    mEntries.clear();
}
