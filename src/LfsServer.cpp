//Our includes
#include "LfsServer.h"
#include "LfsBatchClient.h"
#include "LfsError.h"
#include "LfsObject.h"

//Qt includes
#include <QDebug>
#include <QHostAddress>
#include <QTcpSocket>
#include <QTimer>
#include <QUuid>
#include <QtConcurrent>

//Async includes
#include "asyncfuture.h"

namespace {

const QString healthCheckSegment = QStringLiteral("health_check");
const QString objectsSegment = QStringLiteral("objects");
const QString batchSegment = QStringLiteral("batch");
const QString uploadSegment = QStringLiteral("upload");
const QString downloadSegment = QStringLiteral("download");

QString newRequestId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

LfsServe::HttpResponse methodNotAllowed(const QByteArray& method)
{
    return LfsServe::HttpResponse::error(405,
                                         QStringLiteral("Method %1 not allowed").arg(QString::fromLatin1(method)),
                                         newRequestId());
}

struct BatchOutcome {
    Monad::Result<LfsServe::BatchResponse> response;
    QVector<LfsServe::LfsObject> missing;
};

} // namespace

namespace LfsServe {

LfsServer::LfsServer(std::shared_ptr<RepositoryRegistry> registry, QObject* parent)
    : QObject(parent),
      mRegistry(std::move(registry)),
      mRequestLog(std::make_unique<RequestLog>())
{
    QObject::connect(&mServer, &QTcpServer::newConnection, this, [this]() { handleNewConnections(); });
}

LfsServer::~LfsServer()
{
    stop();
}

void LfsServer::setSelfUrl(const QString& selfUrl)
{
    mSelfUrl = selfUrl;
}

void LfsServer::setMaxUploadSize(qint64 maxUploadSize)
{
    mMaxUploadSize = maxUploadSize;
}

void LfsServer::setUpstreamUrl(const QString& upstreamUrl)
{
    mUpstreamUrl = upstreamUrl;
}

void LfsServer::setRequestTimeout(int timeoutMs)
{
    mRequestTimeoutMs = timeoutMs;
}

Monad::ResultBase LfsServer::start(const QString& host, quint16 port)
{
    if (mServer.isListening()) {
        return Monad::ResultBase(QStringLiteral("Server is already listening on port %1").arg(mServer.serverPort()),
                                 toInt(LfsErrorCode::Io));
    }

    QHostAddress address;
    if (host == QStringLiteral("localhost")) {
        address = QHostAddress(QHostAddress::LocalHost);
    } else if (!address.setAddress(host)) {
        return Monad::ResultBase(QStringLiteral("Invalid listen host %1").arg(host),
                                 toInt(LfsErrorCode::Protocol));
    }

    if (!mServer.listen(address, port)) {
        return Monad::ResultBase(QStringLiteral("Failed to listen on %1:%2: %3")
                                     .arg(host)
                                     .arg(port)
                                     .arg(mServer.errorString()),
                                 toInt(LfsErrorCode::Io));
    }

    mListenHost = address.isEqual(QHostAddress(QHostAddress::AnyIPv4)) || address.isEqual(QHostAddress(QHostAddress::Any))
                      ? QStringLiteral("127.0.0.1")
                      : address.toString();

    auto uriBuilder = UriBuilder::fromStrings(endpoint(), mUpstreamUrl);
    if (uriBuilder.hasError()) {
        mServer.close();
        return Monad::ResultBase(uriBuilder.errorMessage(), uriBuilder.errorCode());
    }

    mBatchHandler = std::make_shared<LfsBatchHandler>(mRegistry, uriBuilder.value(), mMaxUploadSize);

    qInfo() << "[LfsServer] listening on" << address.toString() << mServer.serverPort()
            << "hrefs" << endpoint()
            << "upstream" << (mUpstreamUrl.isEmpty() ? QStringLiteral("none") : mUpstreamUrl)
            << "repositories" << mRegistry->repositoryNames();
    return Monad::ResultBase();
}

void LfsServer::stop()
{
    if (!mServer.isListening()) {
        return;
    }
    mServer.close();
    qInfo() << "[LfsServer] stopped";
}

bool LfsServer::isListening() const
{
    return mServer.isListening();
}

quint16 LfsServer::serverPort() const
{
    return mServer.serverPort();
}

QString LfsServer::endpoint() const
{
    if (!mSelfUrl.isEmpty()) {
        return mSelfUrl;
    }
    return QStringLiteral("http://%1:%2").arg(mListenHost).arg(mServer.serverPort());
}

QUrl LfsServer::repositoryEndpoint(const QString& repository) const
{
    QString base = endpoint();
    if (!base.endsWith(QLatin1Char('/'))) {
        base.append(QLatin1Char('/'));
    }
    return QUrl(base + repository);
}

void LfsServer::handleNewConnections()
{
    while (mServer.hasPendingConnections()) {
        QTcpSocket* socket = mServer.nextPendingConnection();

        auto idleTimer = new QTimer(socket);
        idleTimer->setSingleShot(true);
        idleTimer->setInterval(mRequestTimeoutMs);
        QObject::connect(idleTimer, &QTimer::timeout, socket, [this, socket]() {
            handleRequestTimeout(socket);
        });
        idleTimer->start();

        mConnections.insert(socket, std::make_shared<Connection>(Connection{HttpRequestParser(mMaxUploadSize), idleTimer, false}));

        QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() {
            handleReadyRead(socket);
        });
        QObject::connect(socket, &QTcpSocket::disconnected, socket, [this, socket]() {
            mConnections.remove(socket);
            socket->deleteLater();
        });
    }
}

void LfsServer::handleReadyRead(QTcpSocket* socket)
{
    const QByteArray chunk = socket->readAll();
    auto connection = mConnections.value(socket);
    if (!connection || connection->dispatched || chunk.isEmpty()) {
        return;
    }

    switch (connection->parser.append(chunk)) {
    case HttpRequestParser::State::NeedMoreData:
        connection->idleTimer->start();
        return;
    case HttpRequestParser::State::Error:
        connection->dispatched = true;
        connection->idleTimer->stop();
        qWarning() << "[LfsServer] rejecting request" << connection->parser.errorStatus()
                   << connection->parser.errorMessage();
        respond(socket,
                connection->parser.request(),
                QString(),
                HttpResponse::error(connection->parser.errorStatus(),
                                    connection->parser.errorMessage(),
                                    newRequestId()));
        return;
    case HttpRequestParser::State::Complete:
        connection->dispatched = true;
        connection->idleTimer->stop();
        dispatch(socket, connection->parser.request());
        return;
    }
}

void LfsServer::handleRequestTimeout(QTcpSocket* socket)
{
    auto connection = mConnections.value(socket);
    if (!connection || connection->dispatched) {
        return;
    }
    connection->dispatched = true;

    qWarning() << "[LfsServer] closing idle connection from" << socket->peerAddress().toString()
               << "after" << mRequestTimeoutMs << "ms";
    respond(socket,
            connection->parser.request(),
            QString(),
            HttpResponse::error(408,
                                QStringLiteral("Request not received within %1 ms").arg(mRequestTimeoutMs),
                                newRequestId()));
}

void LfsServer::dispatch(QTcpSocket* socket, const HttpRequest& request)
{
    const QStringList segments = request.pathSegments();

    qDebug() << "[LfsServer] request" << request.method << request.path << "bodyBytes=" << request.body.size();

    if (segments.size() == 1 && segments.at(0) == healthCheckSegment) {
        if (request.method != "GET") {
            respond(socket, request, QString(), methodNotAllowed(request.method));
            return;
        }
        respond(socket, request, QString(), HttpResponse::json(200, QByteArrayLiteral("I_AM_ALIVE"), QByteArrayLiteral("text/plain")));
        return;
    }

    if (segments.size() == 3 && segments.at(1) == objectsSegment && segments.at(2) == batchSegment) {
        if (request.method != "POST") {
            respond(socket, request, segments.at(0), methodNotAllowed(request.method));
            return;
        }
        handleBatch(socket, request, segments.at(0));
        return;
    }

    if (segments.size() == 4 && segments.at(1) == uploadSegment) {
        if (request.method != "PUT") {
            respond(socket, request, segments.at(0), methodNotAllowed(request.method));
            return;
        }
        handleUpload(socket, request, segments.at(0), segments.at(2), segments.at(3));
        return;
    }

    if (segments.size() == 3 && segments.at(1) == downloadSegment) {
        if (request.method != "GET") {
            respond(socket, request, segments.at(0), methodNotAllowed(request.method));
            return;
        }
        handleDownload(socket, request, segments.at(0), segments.at(2));
        return;
    }

    respond(socket, request, QString(), HttpResponse::json(404, QByteArrayLiteral("{\"message\":\"not found\"}")));
}

void LfsServer::handleBatch(QTcpSocket* socket, const HttpRequest& request, const QString& repository)
{
    auto handler = mBatchHandler;
    const QByteArray body = request.body;

    auto future = QtConcurrent::run([handler, repository, body]() {
        const auto parsed = BatchRequest::fromJson(body);
        if (parsed.hasError()) {
            return BatchOutcome{Monad::Result<BatchResponse>(parsed.errorMessage(), parsed.errorCode()),
                                QVector<LfsObject>()};
        }

        BatchOutcome outcome{handler->batch(repository, parsed.value()), QVector<LfsObject>()};
        if (!outcome.response.hasError() && handler->uriBuilder().hasUpstream()) {
            outcome.missing = handler->missingObjects(repository, parsed.value());
        }
        return outcome;
    });

    AsyncFuture::observe(future).context(socket, [this, socket, request, repository, future]() {
        const BatchOutcome outcome = future.result();
        if (outcome.response.hasError()) {
            respond(socket, request, repository,
                    errorResponse(outcome.response.errorMessage(), outcome.response.errorCode()));
            return;
        }

        if (!outcome.missing.isEmpty()) {
            handleUpstreamBatch(socket, request, repository, outcome.response.value(), outcome.missing);
            return;
        }
        respond(socket, request, repository, HttpResponse::json(200, outcome.response.value().toJson(), LfsJsonMime));
    });
}

void LfsServer::handleUpstreamBatch(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                                    const BatchResponse& local, const QVector<LfsObject>& missing)
{
    const UriBuilder& uriBuilder = mBatchHandler->uriBuilder();
    qDebug() << "[LfsServer] asking" << uriBuilder.upstreamBatchUri(repository)
             << "for" << missing.size() << "objects";

    //Parented to the socket, a dropped connection cancels the upstream request
    auto client = new LfsBatchClient(uriBuilder.upstreamEndpoint(repository), socket);
    client->setTransferTimeout(mRequestTimeoutMs);

    auto future = client->batch(LfsOperation::Download, missing);

    AsyncFuture::observe(future).context(socket, [this, socket, request, repository, local, client, future]() {
        client->deleteLater();

        const Monad::Result<BatchResponse> upstream = future.result();
        if (upstream.hasError()) {
            qWarning() << "[LfsServer] upstream batch failed, answering with local hrefs:"
                       << upstream.errorMessage();
            respond(socket, request, repository, HttpResponse::json(200, local.toJson(), LfsJsonMime));
            return;
        }

        const BatchResponse merged = LfsBatchHandler::mergeUpstream(local, upstream.value());
        respond(socket, request, repository, HttpResponse::json(200, merged.toJson(), LfsJsonMime));
    });
}

void LfsServer::handleUpload(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                             const QString& oid, const QString& sizeText)
{
    bool ok = false;
    const qint64 size = sizeText.toLongLong(&ok);
    if (!ok || size < 0 || !LfsObject::isValidOid(oid)) {
        respond(socket, request, repository,
                HttpResponse::error(400, QStringLiteral("Invalid object %1/%2").arg(oid, sizeText), newRequestId()));
        return;
    }

    if (mMaxUploadSize > 0 && size > mMaxUploadSize) {
        respond(socket, request, repository,
                errorResponse(QStringLiteral("Object size %1 exceeds the limit of %2 bytes")
                                  .arg(size)
                                  .arg(mMaxUploadSize),
                              toInt(LfsErrorCode::TooLarge)));
        return;
    }

    if (request.body.size() != size) {
        respond(socket, request, repository,
                HttpResponse::error(400,
                                    QStringLiteral("Received %1 bytes, object size is %2")
                                        .arg(request.body.size())
                                        .arg(size),
                                    newRequestId()));
        return;
    }

    auto registry = mRegistry;
    const QByteArray body = request.body;

    auto future = QtConcurrent::run([registry, repository, oid, size, body]() {
        const auto store = registry->lookup(repository);
        if (store.hasError()) {
            return Monad::ResultBase(store.errorMessage(), store.errorCode());
        }
        return store.value()->put(oid, size, body);
    });

    AsyncFuture::observe(future).context(socket, [this, socket, request, repository, future]() {
        const Monad::ResultBase result = future.result();
        if (result.hasError()) {
            respond(socket, request, repository, errorResponse(result.errorMessage(), result.errorCode()));
            return;
        }
        respond(socket, request, repository, HttpResponse::json(200, QByteArrayLiteral("{}")));
    });
}

void LfsServer::handleDownload(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                               const QString& oid)
{
    if (!LfsObject::isValidOid(oid)) {
        respond(socket, request, repository,
                HttpResponse::error(400, QStringLiteral("Invalid object id %1").arg(oid), newRequestId()));
        return;
    }

    auto registry = mRegistry;

    auto future = QtConcurrent::run([registry, repository, oid]() {
        const auto store = registry->lookup(repository);
        if (store.hasError()) {
            return Monad::Result<QByteArray>(store.errorMessage(), store.errorCode());
        }
        return store.value()->get(oid);
    });

    AsyncFuture::observe(future).context(socket, [this, socket, request, repository, future]() {
        const Monad::Result<QByteArray> result = future.result();
        if (result.hasError()) {
            respond(socket, request, repository, errorResponse(result.errorMessage(), result.errorCode()));
            return;
        }
        respond(socket, request, repository,
                HttpResponse::json(200, result.value(), QByteArrayLiteral("application/octet-stream")));
    });
}

HttpResponse LfsServer::errorResponse(const QString& message, int errorCode) const
{
    return HttpResponse::error(httpStatusForError(errorCode), message, newRequestId());
}

void LfsServer::respond(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                        const HttpResponse& response)
{
    mRequestLog->append(RequestLogEntry(request.method,
                                        request.path,
                                        repository,
                                        response.status,
                                        request.body.size(),
                                        response.body.size()));

    qInfo() << "[LfsServer]" << request.method << request.path << response.status
            << "in=" << request.body.size() << "out=" << response.body.size();

    socket->write(response.toByteArray());
    socket->flush();
    socket->disconnectFromHost();
}

} // namespace LfsServe
