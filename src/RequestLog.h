#ifndef REQUESTLOG_H
#define REQUESTLOG_H

//Qt includes
#include <QByteArray>
#include <QContiguousCache>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QVariantMap>
#include <QVector>

#include "Monad/Result.h"

namespace LfsServe {

class RequestLogEntry
{
public:
    RequestLogEntry() = default;
    RequestLogEntry(QByteArray method, QString path, QString repository, int status,
                    qint64 requestBytes, qint64 responseBytes,
                    QDateTime timestamp = QDateTime::currentDateTimeUtc());

    QDateTime timestamp() const { return mTimestamp; }
    QByteArray method() const { return mMethod; }
    QString path() const { return mPath; }
    QString repository() const { return mRepository; }
    int status() const { return mStatus; }
    qint64 requestBytes() const { return mRequestBytes; }
    qint64 responseBytes() const { return mResponseBytes; }

    QVariantMap data() const;
    QString toJsonString() const;
    static RequestLogEntry fromJson(const QString& json);

private:
    QDateTime mTimestamp;
    QByteArray mMethod;
    QString mPath;
    QString mRepository;
    int mStatus = 0;
    qint64 mRequestBytes = 0;
    qint64 mResponseBytes = 0;
};

/**
 * Append-only record of completed requests, one entry per response written.
 * When a file path is set every entry is also appended to it as one JSON line.
 * Memory keeps only the most recent capacity() entries, the file keeps all.
 */
class RequestLog
{
public:
    static constexpr int DefaultCapacity = 10000;

    explicit RequestLog(int capacity = DefaultCapacity);

    int capacity() const;
    void setCapacity(int capacity);

    Monad::ResultBase setFilePath(const QString& filePath);
    QString filePath() const;

    void append(const RequestLogEntry& entry);

    QVector<RequestLogEntry> entries() const;
    int size() const;
    int count(const QByteArray& method, const QString& pathContains = QString()) const;
    void clear();

private:
    mutable QMutex mMutex;
    QContiguousCache<RequestLogEntry> mEntries;
    QString mFilePath;
};

} // namespace LfsServe

#endif // REQUESTLOG_H
