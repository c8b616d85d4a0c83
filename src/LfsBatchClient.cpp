#include "LfsBatchClient.h"
#include "LfsError.h"

#include <QByteArray>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include "asyncfuture.h"

namespace {
constexpr int ErrorBodyPreviewBytes = 512;

QString trimTrailingSlash(QString value)
{
    while (value.endsWith('/')) {
        value.chop(1);
    }
    return value;
}

QString responseBodyPreview(const QByteArray& body)
{
    if (body.isEmpty()) {
        return QString();
    }

    //Server error documents carry the reason in "message"
    const QJsonDocument document = QJsonDocument::fromJson(body);
    if (document.isObject()) {
        const QString message = document.object().value(QStringLiteral("message")).toString();
        if (!message.isEmpty()) {
            return message;
        }
    }

    const bool truncated = body.size() > ErrorBodyPreviewBytes;
    const QByteArray previewBytes = truncated ? body.left(ErrorBodyPreviewBytes) : body;
    const QString previewText = QString::fromUtf8(previewBytes).simplified();
    if (truncated) {
        return QStringLiteral("%1 [truncated]").arg(previewText);
    }
    return previewText;
}

QString enrichReplyErrorMessage(const QString& baseMessage, QNetworkReply* reply, int httpStatus)
{
    QString message = baseMessage;
    if (httpStatus > 0) {
        message += QStringLiteral(" (%1)").arg(httpStatus);
    }

    const QString bodyPreview = responseBodyPreview(reply->readAll());
    if (!bodyPreview.isEmpty()) {
        message += QStringLiteral(": %1").arg(bodyPreview);
    } else if (reply->error() != QNetworkReply::NoError) {
        message += QStringLiteral(": %1").arg(reply->errorString());
    }
    return message;
}

}

namespace LfsServe {

LfsBatchClient::LfsBatchClient(QUrl endpoint, QObject* parent)
    : QObject(parent),
      mEndpoint(std::move(endpoint)),
      mManager(new QNetworkAccessManager(this))
{
}

QUrl LfsBatchClient::batchUrl() const
{
    QUrl url(mEndpoint);
    url.setPath(trimTrailingSlash(mEndpoint.path()) + QStringLiteral("/objects/batch"));
    return url;
}

void LfsBatchClient::setTransferTimeout(int timeoutMs)
{
    mTransferTimeoutMs = timeoutMs;
}

void LfsBatchClient::setMaxRetries(int maxRetries)
{
    mMaxRetries = qMax(0, maxRetries);
}

QFuture<Monad::Result<BatchResponse>> LfsBatchClient::batch(LfsOperation operation,
                                                            const QVector<LfsObject>& objects) const
{
    if (!mEndpoint.isValid() || mEndpoint.scheme().isEmpty()) {
        return AsyncFuture::completed(Monad::Result<BatchResponse>(QStringLiteral("Invalid LFS endpoint %1").arg(mEndpoint.toString()),
                                                                   toInt(LfsErrorCode::Protocol)));
    }

    BatchRequest batchRequest;
    batchRequest.operation = operation;
    batchRequest.transfers = QStringList{QStringLiteral("basic")};
    batchRequest.objects = objects;

    QNetworkRequest request(batchUrl());
    request.setHeader(QNetworkRequest::ContentTypeHeader, LfsJsonMime);
    request.setRawHeader("Accept", LfsJsonMime);
    request.setTransferTimeout(mTransferTimeoutMs);

    auto deferred = AsyncFuture::deferred<Monad::Result<BatchResponse>>();
    deferred.reportStarted();

    QNetworkReply* reply = mManager->post(request, batchRequest.toJson());

    auto finish = [deferred, reply](const Monad::Result<BatchResponse>& result) mutable {
        deferred.complete(result);
        reply->deleteLater();
    };

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, finish]() mutable {
        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus >= 400 || reply->error() != QNetworkReply::NoError) {
            finish(Monad::Result<BatchResponse>(enrichReplyErrorMessage(QStringLiteral("LFS batch request failed"),
                                                                        reply,
                                                                        httpStatus),
                                                errorCodeForReply(reply, httpStatus)));
            return;
        }

        finish(BatchResponse::fromJson(reply->readAll()));
    });

    return deferred.future();
}

QFuture<Monad::ResultBase> LfsBatchClient::uploadObject(const Action& action,
                                                        const QByteArray& bytes,
                                                        const LfsObject& object) const
{
    if (!action.href.isValid()) {
        return AsyncFuture::completed(Monad::ResultBase(QStringLiteral("Missing LFS upload href"),
                                                        toInt(LfsErrorCode::Protocol)));
    }

    if (bytes.size() != object.size) {
        return AsyncFuture::completed(Monad::ResultBase(QStringLiteral("LFS object size mismatch before upload"),
                                                        toInt(LfsErrorCode::Protocol)));
    }

    auto deferred = AsyncFuture::deferred<Monad::ResultBase>();
    deferred.reportStarted();

    QNetworkRequest request(action.href);
    applyHeaders(&request, action.headers);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
    request.setTransferTimeout(mTransferTimeoutMs);

    QNetworkReply* reply = mManager->put(request, bytes);

    auto finish = [deferred, reply](const Monad::ResultBase& result) mutable {
        deferred.complete(result);
        reply->deleteLater();
    };

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, finish, object]() mutable {
        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus >= 400 || reply->error() != QNetworkReply::NoError) {
            finish(Monad::ResultBase(enrichReplyErrorMessage(QStringLiteral("LFS upload of %1 failed").arg(object.oid),
                                                             reply,
                                                             httpStatus),
                                     errorCodeForReply(reply, httpStatus)));
            return;
        }

        qDebug() << "[LfsBatchClient] uploaded" << object.oid << object.size;
        finish(Monad::ResultBase());
    });

    return deferred.future();
}

QFuture<Monad::Result<QByteArray>> LfsBatchClient::downloadObject(const Action& action,
                                                                  const LfsObject& expected) const
{
    if (!action.href.isValid()) {
        return AsyncFuture::completed(Monad::Result<QByteArray>(QStringLiteral("Missing LFS download href"),
                                                                toInt(LfsErrorCode::Protocol)));
    }

    auto deferred = AsyncFuture::deferred<Monad::Result<QByteArray>>();
    deferred.reportStarted();

    QNetworkRequest request(action.href);
    applyHeaders(&request, action.headers);
    request.setTransferTimeout(mTransferTimeoutMs);

    QNetworkReply* reply = mManager->get(request);

    auto finish = [deferred, reply](const Monad::Result<QByteArray>& result) mutable {
        deferred.complete(result);
        reply->deleteLater();
    };

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, finish, expected]() mutable {
        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus >= 400 || reply->error() != QNetworkReply::NoError) {
            finish(Monad::Result<QByteArray>(enrichReplyErrorMessage(QStringLiteral("LFS download of %1 failed").arg(expected.oid),
                                                                     reply,
                                                                     httpStatus),
                                             errorCodeForReply(reply, httpStatus)));
            return;
        }

        const QByteArray bytes = reply->readAll();
        const LfsObject actual = LfsObject::fromData(bytes);
        if (actual != expected) {
            qWarning() << "[LfsBatchClient] download hash mismatch, expected" << expected.oid << expected.size
                       << "got" << actual.oid << actual.size;
            finish(Monad::Result<QByteArray>(QStringLiteral("LFS download hash mismatch for %1").arg(expected.oid),
                                             toInt(LfsErrorCode::HashCollisionOrCorruption)));
            return;
        }

        finish(Monad::Result<QByteArray>(bytes));
    });

    return deferred.future();
}

QFuture<Monad::Result<LfsObject>> LfsBatchClient::submit(const QByteArray& bytes)
{
    const LfsObject object = LfsObject::fromData(bytes);
    auto batchFuture = batch(LfsOperation::Upload, {object});

    return AsyncFuture::observe(batchFuture)
        .context(this, [this, bytes, object](const Monad::Result<BatchResponse>& batchResult) {
        if (batchResult.hasError()) {
            return AsyncFuture::completed(Monad::Result<LfsObject>(batchResult.errorMessage(), batchResult.errorCode()));
        }

        const ObjectResponse* objectResponse = batchResult.value().find(object.oid);
        if (!objectResponse) {
            return AsyncFuture::completed(Monad::Result<LfsObject>(QStringLiteral("Missing LFS batch response for %1").arg(object.oid),
                                                                   toInt(LfsErrorCode::Protocol)));
        }

        if (objectResponse->hasError()) {
            return AsyncFuture::completed(Monad::Result<LfsObject>(objectResponse->errorMessage,
                                                                   errorCodeForObject(*objectResponse)));
        }

        if (!objectResponse->hasAction(QStringLiteral("upload"))) {
            qDebug() << "[LfsBatchClient] already stored, skipping upload" << object.oid;
            return AsyncFuture::completed(Monad::Result<LfsObject>(object));
        }

        auto uploadFuture = uploadWithRetry(objectResponse->actions.value(QStringLiteral("upload")),
                                            bytes,
                                            object,
                                            mMaxRetries);
        return AsyncFuture::observe(uploadFuture)
            .context(this, [object](const Monad::ResultBase& uploadResult) {
                if (uploadResult.hasError()) {
                    return Monad::Result<LfsObject>(uploadResult.errorMessage(), uploadResult.errorCode());
                }
                return Monad::Result<LfsObject>(object);
            }).future();
    }).future();
}

QFuture<Monad::Result<QByteArray>> LfsBatchClient::fetch(const LfsObject& object)
{
    if (!object.isValid()) {
        return AsyncFuture::completed(Monad::Result<QByteArray>(QStringLiteral("Invalid LFS object %1").arg(object.oid),
                                                                toInt(LfsErrorCode::Protocol)));
    }

    auto batchFuture = batch(LfsOperation::Download, {object});

    return AsyncFuture::observe(batchFuture)
        .context(this, [this, object](const Monad::Result<BatchResponse>& batchResult) {
        if (batchResult.hasError()) {
            return AsyncFuture::completed(Monad::Result<QByteArray>(batchResult.errorMessage(), batchResult.errorCode()));
        }

        const ObjectResponse* objectResponse = batchResult.value().find(object.oid);
        if (!objectResponse) {
            return AsyncFuture::completed(Monad::Result<QByteArray>(QStringLiteral("Missing LFS batch response for %1").arg(object.oid),
                                                                    toInt(LfsErrorCode::Protocol)));
        }

        if (objectResponse->hasError()) {
            return AsyncFuture::completed(Monad::Result<QByteArray>(objectResponse->errorMessage,
                                                                    errorCodeForObject(*objectResponse)));
        }

        if (!objectResponse->hasAction(QStringLiteral("download"))) {
            return AsyncFuture::completed(Monad::Result<QByteArray>(QStringLiteral("Missing LFS download action for %1").arg(object.oid),
                                                                    toInt(LfsErrorCode::Protocol)));
        }

        return downloadWithRetry(objectResponse->actions.value(QStringLiteral("download")), object, mMaxRetries);
    }).future();
}

QFuture<Monad::ResultBase> LfsBatchClient::uploadWithRetry(const Action& action,
                                                           const QByteArray& bytes,
                                                           const LfsObject& object,
                                                           int retriesLeft)
{
    auto future = uploadObject(action, bytes, object);
    return AsyncFuture::observe(future)
        .context(this, [this, action, bytes, object, retriesLeft](const Monad::ResultBase& result) {
        if (result.hasError() && isRetryableError(result.errorCode()) && retriesLeft > 0) {
            qWarning() << "[LfsBatchClient] retrying upload" << object.oid << result.errorMessage()
                       << "retries left" << retriesLeft;
            return uploadWithRetry(action, bytes, object, retriesLeft - 1);
        }
        return AsyncFuture::completed(result);
    }).future();
}

QFuture<Monad::Result<QByteArray>> LfsBatchClient::downloadWithRetry(const Action& action,
                                                                     const LfsObject& expected,
                                                                     int retriesLeft)
{
    auto future = downloadObject(action, expected);
    return AsyncFuture::observe(future)
        .context(this, [this, action, expected, retriesLeft](const Monad::Result<QByteArray>& result) {
        if (result.hasError() && isRetryableError(result.errorCode()) && retriesLeft > 0) {
            qWarning() << "[LfsBatchClient] retrying download" << expected.oid << result.errorMessage()
                       << "retries left" << retriesLeft;
            return downloadWithRetry(action, expected, retriesLeft - 1);
        }
        return AsyncFuture::completed(result);
    }).future();
}

void LfsBatchClient::applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers)
{
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        request->setRawHeader(it.key(), it.value());
    }
}

bool LfsBatchClient::isOfflineError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
        return true;
    default:
        return false;
    }
}

bool LfsBatchClient::isTimeoutError(QNetworkReply::NetworkError error)
{
    //A request that hits its transfer timeout is aborted as canceled
    return error == QNetworkReply::TimeoutError
           || error == QNetworkReply::OperationCanceledError;
}

int LfsBatchClient::errorCodeForHttpStatus(int httpStatus)
{
    switch (httpStatus) {
    case 403:
        return toInt(LfsErrorCode::ReadOnlyViolation);
    case 404:
        return toInt(LfsErrorCode::NotFound);
    case 409:
        return toInt(LfsErrorCode::HashCollisionOrCorruption);
    case 413:
        return toInt(LfsErrorCode::TooLarge);
    case 400:
    case 422:
        return toInt(LfsErrorCode::Protocol);
    case 504:
        return toInt(LfsErrorCode::TransferTimeout);
    default:
        return toInt(LfsErrorCode::Transfer);
    }
}

int LfsBatchClient::errorCodeForReply(QNetworkReply* reply, int httpStatus)
{
    if (httpStatus >= 400) {
        return errorCodeForHttpStatus(httpStatus);
    }

    const QNetworkReply::NetworkError error = reply->error();
    if (isTimeoutError(error)) {
        return toInt(LfsErrorCode::TransferTimeout);
    }
    if (isOfflineError(error)) {
        return toInt(LfsErrorCode::Offline);
    }
    return toInt(LfsErrorCode::Transfer);
}

int LfsBatchClient::errorCodeForObject(const ObjectResponse& object)
{
    return errorCodeForHttpStatus(object.errorCode);
}

} // namespace LfsServe
