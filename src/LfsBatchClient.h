#ifndef LFSBATCHCLIENT_H
#define LFSBATCHCLIENT_H

#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QNetworkReply>
#include <QUrl>
#include <QVector>

class QNetworkRequest;
class QNetworkAccessManager;

#include "LfsObject.h"
#include "LfsProtocol.h"
#include "Monad/Result.h"

namespace LfsServe {

/**
 * Client side of the LFS transfer protocol.
 *
 * endpoint is the repository url, http://host:port/<repo>, and batch requests
 * go to <endpoint>/objects/batch. Transfers follow the hrefs handed out by
 * the batch response. Every request carries a transfer timeout; submit() and
 * fetch() retry a timed out transfer with the same oid up to maxRetries times.
 */
class LfsBatchClient : public QObject
{
    Q_OBJECT

public:
    explicit LfsBatchClient(QUrl endpoint, QObject* parent = nullptr);

    QUrl endpoint() const { return mEndpoint; }
    QUrl batchUrl() const;

    int transferTimeout() const { return mTransferTimeoutMs; }
    void setTransferTimeout(int timeoutMs);

    int maxRetries() const { return mMaxRetries; }
    void setMaxRetries(int maxRetries);

    QFuture<Monad::Result<BatchResponse>> batch(LfsOperation operation,
                                                const QVector<LfsObject>& objects) const;

    QFuture<Monad::ResultBase> uploadObject(const Action& action,
                                            const QByteArray& bytes,
                                            const LfsObject& object) const;

    QFuture<Monad::Result<QByteArray>> downloadObject(const Action& action,
                                                      const LfsObject& expected) const;

    //Hashes bytes, negotiates an upload and transfers only when the server asks for it
    QFuture<Monad::Result<LfsObject>> submit(const QByteArray& bytes);

    //Negotiates a download for object and returns the verified bytes
    QFuture<Monad::Result<QByteArray>> fetch(const LfsObject& object);

    static int errorCodeForHttpStatus(int httpStatus);

private:
    QUrl mEndpoint;
    QNetworkAccessManager* mManager = nullptr;
    int mTransferTimeoutMs = 30000;
    int mMaxRetries = 2;

    QFuture<Monad::ResultBase> uploadWithRetry(const Action& action,
                                               const QByteArray& bytes,
                                               const LfsObject& object,
                                               int retriesLeft);
    QFuture<Monad::Result<QByteArray>> downloadWithRetry(const Action& action,
                                                         const LfsObject& expected,
                                                         int retriesLeft);

    static void applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers);
    static bool isOfflineError(QNetworkReply::NetworkError error);
    static bool isTimeoutError(QNetworkReply::NetworkError error);
    static int errorCodeForReply(QNetworkReply* reply, int httpStatus);
    static int errorCodeForObject(const ObjectResponse& object);
};

} // namespace LfsServe

#endif // LFSBATCHCLIENT_H
