#ifndef LFSPROTOCOL_H
#define LFSPROTOCOL_H

#include <QByteArray>
#include <QHash>
#include <QJsonValue>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVector>

#include "LfsObject.h"
#include "Monad/Result.h"

namespace LfsServe {

//Batch API documents, see https://github.com/git-lfs/git-lfs/blob/main/docs/api/batch.md

constexpr const char* LfsJsonMime = "application/vnd.git-lfs+json";

enum class LfsOperation {
    Upload,
    Download
};

QString operationName(LfsOperation operation);

//Sizes travel as JSON numbers. Returns -1 unless value is a whole number in [0, 2^53]
qint64 sizeFromJson(const QJsonValue& value);

struct BatchRequest {
    LfsOperation operation = LfsOperation::Download;
    QStringList transfers;
    QVector<LfsObject> objects;

    QByteArray toJson() const;
    static Monad::Result<BatchRequest> fromJson(const QByteArray& json);
};

struct Action {
    QUrl href;
    QMap<QByteArray, QByteArray> headers;
};

struct ObjectResponse {
    QString oid;
    qint64 size = 0;
    QHash<QString, Action> actions;
    int errorCode = 0;
    QString errorMessage;

    bool hasError() const { return errorCode != 0; }
    bool hasAction(const QString& name) const { return actions.contains(name); }
};

struct BatchResponse {
    QString transfer = QStringLiteral("basic");
    QVector<ObjectResponse> objects;

    const ObjectResponse* find(const QString& oid) const;

    QByteArray toJson() const;
    static Monad::Result<BatchResponse> fromJson(const QByteArray& json);
};

} // namespace LfsServe

#endif // LFSPROTOCOL_H
