#include "LfsBatchHandler.h"
#include "LfsError.h"

#include <QDebug>

namespace {

LfsServe::ObjectResponse objectError(const LfsServe::LfsObject& object, int httpCode, const QString& message)
{
    LfsServe::ObjectResponse response;
    response.oid = object.oid;
    response.size = object.size;
    response.errorCode = httpCode;
    response.errorMessage = message;
    return response;
}

} // namespace

namespace LfsServe {

LfsBatchHandler::LfsBatchHandler(std::shared_ptr<const RepositoryRegistry> registry,
                                 UriBuilder uriBuilder,
                                 qint64 maxUploadSize)
    : mRegistry(std::move(registry)),
    mUriBuilder(std::move(uriBuilder)),
    mMaxUploadSize(maxUploadSize)
{
}

Monad::Result<BatchResponse> LfsBatchHandler::batch(const QString& repository, const BatchRequest& request) const
{
    const auto storeResult = mRegistry->lookup(repository);
    if (storeResult.hasError()) {
        return Monad::Result<BatchResponse>(storeResult.errorMessage(), storeResult.errorCode());
    }
    const ContentStorePtr store = storeResult.value();

    BatchResponse response;
    response.transfer = QStringLiteral("basic");
    response.objects.reserve(request.objects.size());

    for (const auto& object : request.objects) {
        if (!object.isValid()) {
            response.objects.push_back(objectError(object, 422, QStringLiteral("Invalid object oid or size")));
            continue;
        }

        if (request.operation == LfsOperation::Upload) {
            response.objects.push_back(uploadResponse(repository, *store, object));
        } else {
            response.objects.push_back(downloadResponse(repository, object));
        }
    }

    qDebug() << "[LfsBatchHandler]" << repository << operationName(request.operation)
             << "objects=" << response.objects.size();
    return Monad::Result<BatchResponse>(response);
}

QVector<LfsObject> LfsBatchHandler::missingObjects(const QString& repository, const BatchRequest& request) const
{
    QVector<LfsObject> missing;
    if (request.operation != LfsOperation::Download) {
        return missing;
    }

    const ContentStorePtr store = mRegistry->storeFor(repository);
    if (!store) {
        return missing;
    }

    for (const auto& object : request.objects) {
        if (object.isValid() && !store->has(object.oid)) {
            missing.push_back(object);
        }
    }
    return missing;
}

BatchResponse LfsBatchHandler::mergeUpstream(const BatchResponse& local, const BatchResponse& upstream)
{
    BatchResponse merged = local;
    for (auto& object : merged.objects) {
        const ObjectResponse* remote = upstream.find(object.oid);
        if (remote && !remote->hasError() && remote->hasAction(QStringLiteral("download"))) {
            object = *remote;
        }
    }
    return merged;
}

ObjectResponse LfsBatchHandler::uploadResponse(const QString& repository,
                                               const ContentStore& store,
                                               const LfsObject& object) const
{
    if (mMaxUploadSize > 0 && object.size > mMaxUploadSize) {
        return objectError(object, 413, QStringLiteral("Object size %1 exceeds the maximum upload size %2")
                                            .arg(object.size)
                                            .arg(mMaxUploadSize));
    }

    ObjectResponse response;
    response.oid = object.oid;
    response.size = object.size;

    if (store.has(object.oid)) {
        const auto storedSize = store.size(object.oid);
        if (!storedSize.hasError() && storedSize.value() != object.size) {
            return objectError(object, 409, QStringLiteral("Object is stored with size %1")
                                                .arg(storedSize.value()));
        }
        //No actions: the object is already stored, the client has nothing to transfer
        return response;
    }

    Action upload;
    upload.href = mUriBuilder.uploadUri(repository, object);
    response.actions.insert(QStringLiteral("upload"), upload);
    return response;
}

ObjectResponse LfsBatchHandler::downloadResponse(const QString& repository, const LfsObject& object) const
{
    ObjectResponse response;
    response.oid = object.oid;
    response.size = object.size;

    Action download;
    download.href = mUriBuilder.downloadUri(repository, object.oid);
    response.actions.insert(QStringLiteral("download"), download);
    return response;
}

} // namespace LfsServe
