#include "LfsProtocol.h"
#include "LfsError.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cmath>

namespace {

//Largest integer a JSON number (an IEEE double) carries exactly
constexpr double MaxExactJsonInteger = 9007199254740992.0;

Monad::Result<QJsonObject> parseObjectDocument(const QByteArray& json, const QString& what)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (document.isNull() || !document.isObject()) {
        return Monad::Result<QJsonObject>(QStringLiteral("Invalid LFS %1: %2").arg(what, parseError.errorString()),
                                          LfsServe::toInt(LfsServe::LfsErrorCode::Protocol));
    }
    return Monad::Result<QJsonObject>(document.object());
}

} // namespace

namespace LfsServe {

QString operationName(LfsOperation operation)
{
    switch (operation) {
    case LfsOperation::Upload:
        return QStringLiteral("upload");
    case LfsOperation::Download:
        return QStringLiteral("download");
    }
    return QString();
}

qint64 sizeFromJson(const QJsonValue& value)
{
    if (!value.isDouble()) {
        return -1;
    }
    const double size = value.toDouble();
    if (!std::isfinite(size) || size < 0 || size > MaxExactJsonInteger || std::floor(size) != size) {
        return -1;
    }
    return static_cast<qint64>(size);
}

QByteArray BatchRequest::toJson() const
{
    QJsonObject root;
    root.insert(QStringLiteral("operation"), operationName(operation));

    QJsonArray transferArray;
    const QStringList names = transfers.isEmpty() ? QStringList{QStringLiteral("basic")} : transfers;
    for (const QString& name : names) {
        transferArray.append(name);
    }
    root.insert(QStringLiteral("transfers"), transferArray);

    QJsonArray objectArray;
    for (const auto& object : objects) {
        QJsonObject entry;
        entry.insert(QStringLiteral("oid"), object.oid);
        entry.insert(QStringLiteral("size"), static_cast<double>(object.size));
        objectArray.append(entry);
    }
    root.insert(QStringLiteral("objects"), objectArray);

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Monad::Result<BatchRequest> BatchRequest::fromJson(const QByteArray& json)
{
    const auto documentResult = parseObjectDocument(json, QStringLiteral("batch request"));
    if (documentResult.hasError()) {
        return Monad::Result<BatchRequest>(documentResult.errorMessage(), documentResult.errorCode());
    }
    const QJsonObject root = documentResult.value();

    BatchRequest request;
    const QString operation = root.value(QStringLiteral("operation")).toString();
    if (operation == QStringLiteral("upload")) {
        request.operation = LfsOperation::Upload;
    } else if (operation == QStringLiteral("download")) {
        request.operation = LfsOperation::Download;
    } else {
        return Monad::Result<BatchRequest>(QStringLiteral("Unsupported LFS operation: %1").arg(operation),
                                           toInt(LfsErrorCode::Protocol));
    }

    const QJsonArray transfers = root.value(QStringLiteral("transfers")).toArray();
    for (const auto& transfer : transfers) {
        request.transfers.append(transfer.toString());
    }

    const QJsonValue objectsValue = root.value(QStringLiteral("objects"));
    if (!objectsValue.isArray()) {
        return Monad::Result<BatchRequest>(QStringLiteral("Missing LFS batch objects"),
                                           toInt(LfsErrorCode::Protocol));
    }

    const QJsonArray objectsArray = objectsValue.toArray();
    request.objects.reserve(objectsArray.size());
    for (const auto& entry : objectsArray) {
        const QJsonObject object = entry.toObject();
        LfsObject requested;
        requested.oid = object.value(QStringLiteral("oid")).toString();
        requested.size = sizeFromJson(object.value(QStringLiteral("size")));
        request.objects.push_back(requested);
    }

    return Monad::Result<BatchRequest>(request);
}

const ObjectResponse* BatchResponse::find(const QString& oid) const
{
    for (const auto& entry : objects) {
        if (entry.oid == oid) {
            return &entry;
        }
    }
    return nullptr;
}

QByteArray BatchResponse::toJson() const
{
    QJsonObject root;
    root.insert(QStringLiteral("transfer"), transfer);

    QJsonArray objectArray;
    for (const auto& object : objects) {
        QJsonObject entry;
        entry.insert(QStringLiteral("oid"), object.oid);
        entry.insert(QStringLiteral("size"), static_cast<double>(object.size));

        if (object.hasError()) {
            QJsonObject error;
            error.insert(QStringLiteral("code"), object.errorCode);
            error.insert(QStringLiteral("message"), object.errorMessage);
            entry.insert(QStringLiteral("error"), error);
        } else if (!object.actions.isEmpty()) {
            QJsonObject actions;
            for (auto it = object.actions.begin(); it != object.actions.end(); ++it) {
                QJsonObject action;
                action.insert(QStringLiteral("href"), it.value().href.toString());
                if (!it.value().headers.isEmpty()) {
                    QJsonObject headers;
                    for (auto headerIt = it.value().headers.begin(); headerIt != it.value().headers.end(); ++headerIt) {
                        headers.insert(QString::fromUtf8(headerIt.key()), QString::fromUtf8(headerIt.value()));
                    }
                    action.insert(QStringLiteral("header"), headers);
                }
                actions.insert(it.key(), action);
            }
            entry.insert(QStringLiteral("actions"), actions);
        }

        objectArray.append(entry);
    }
    root.insert(QStringLiteral("objects"), objectArray);

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Monad::Result<BatchResponse> BatchResponse::fromJson(const QByteArray& json)
{
    const auto documentResult = parseObjectDocument(json, QStringLiteral("batch response"));
    if (documentResult.hasError()) {
        return Monad::Result<BatchResponse>(documentResult.errorMessage(), documentResult.errorCode());
    }
    const QJsonObject root = documentResult.value();

    BatchResponse response;
    response.transfer = root.value(QStringLiteral("transfer")).toString();

    const QJsonArray objectsArray = root.value(QStringLiteral("objects")).toArray();
    response.objects.reserve(objectsArray.size());

    for (const auto& entry : objectsArray) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject object = entry.toObject();
        ObjectResponse objectResponse;
        objectResponse.oid = object.value(QStringLiteral("oid")).toString();
        objectResponse.size = sizeFromJson(object.value(QStringLiteral("size")));

        const QJsonObject errorObject = object.value(QStringLiteral("error")).toObject();
        if (!errorObject.isEmpty()) {
            objectResponse.errorCode = errorObject.value(QStringLiteral("code")).toInt();
            objectResponse.errorMessage = errorObject.value(QStringLiteral("message")).toString();
        }

        const QJsonObject actions = object.value(QStringLiteral("actions")).toObject();
        for (auto it = actions.begin(); it != actions.end(); ++it) {
            if (!it.value().isObject()) {
                continue;
            }
            const QJsonObject actionObject = it.value().toObject();
            Action action;
            action.href = QUrl(actionObject.value(QStringLiteral("href")).toString());
            const QJsonObject headers = actionObject.value(QStringLiteral("header")).toObject();
            for (auto headerIt = headers.begin(); headerIt != headers.end(); ++headerIt) {
                action.headers.insert(headerIt.key().toUtf8(), headerIt.value().toString().toUtf8());
            }
            objectResponse.actions.insert(it.key(), action);
        }

        response.objects.push_back(objectResponse);
    }

    return Monad::Result<BatchResponse>(response);
}

} // namespace LfsServe
