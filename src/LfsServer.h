#ifndef LFSSERVER_H
#define LFSSERVER_H

//Qt includes
#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QUrl>
#include <QVector>

//Std includes
#include <memory>

//Our includes
#include "HttpMessage.h"
#include "LfsBatchHandler.h"
#include "RepositoryRegistry.h"
#include "RequestLog.h"
#include "Monad/Result.h"

class QTcpSocket;
class QTimer;

namespace LfsServe {

/**
 * HTTP/1.1 front-end for the LFS transfer endpoints:
 *
 *   POST /<repo>/objects/batch
 *   PUT  /<repo>/upload/<oid>/<size>
 *   GET  /<repo>/download/<oid>
 *   GET  /health_check
 *
 * Sockets are served on the thread that owns the server. Store work runs on
 * the global thread pool and the response is written back on the socket's
 * thread once the work finishes. Every connection carries one request and
 * is answered with 408 when it sits idle longer than requestTimeout().
 *
 * With an upstream url, download batches ask the upstream server for the
 * objects this server does not hold and hand out its hrefs for them.
 */
class LfsServer : public QObject
{
    Q_OBJECT

public:
    explicit LfsServer(std::shared_ptr<RepositoryRegistry> registry, QObject* parent = nullptr);
    ~LfsServer() override;

    //Public base url used in batch hrefs, empty means http://<host>:<bound port>
    void setSelfUrl(const QString& selfUrl);

    void setMaxUploadSize(qint64 maxUploadSize);

    //Base url of another LFS server with the same repository names, empty for none
    void setUpstreamUrl(const QString& upstreamUrl);

    static constexpr int DefaultRequestTimeoutMs = 30000;
    void setRequestTimeout(int timeoutMs);
    int requestTimeout() const { return mRequestTimeoutMs; }

    Monad::ResultBase start(const QString& host = QStringLiteral("127.0.0.1"), quint16 port = 0);
    void stop();

    bool isListening() const;
    quint16 serverPort() const;

    QString endpoint() const;
    QUrl repositoryEndpoint(const QString& repository) const;

    RequestLog* requestLog() const { return mRequestLog.get(); }

    //Open connections, answered or not
    int connectionCount() const { return mConnections.size(); }

private:
    struct Connection {
        HttpRequestParser parser;
        QTimer* idleTimer = nullptr; //!< owned by the socket
        bool dispatched = false;
    };

    void handleNewConnections();
    void handleReadyRead(QTcpSocket* socket);
    void handleRequestTimeout(QTcpSocket* socket);
    void dispatch(QTcpSocket* socket, const HttpRequest& request);

    void handleBatch(QTcpSocket* socket, const HttpRequest& request, const QString& repository);
    void handleUpstreamBatch(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                             const BatchResponse& local, const QVector<LfsObject>& missing);
    void handleUpload(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                      const QString& oid, const QString& sizeText);
    void handleDownload(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                        const QString& oid);

    void respond(QTcpSocket* socket, const HttpRequest& request, const QString& repository,
                 const HttpResponse& response);
    HttpResponse errorResponse(const QString& message, int errorCode) const;

    std::shared_ptr<RepositoryRegistry> mRegistry;
    std::shared_ptr<const LfsBatchHandler> mBatchHandler;
    std::unique_ptr<RequestLog> mRequestLog;
    //Declared before mServer, sockets torn down with the server still emit disconnected
    QHash<QTcpSocket*, std::shared_ptr<Connection>> mConnections;
    QTcpServer mServer;
    QString mSelfUrl;
    QString mUpstreamUrl;
    QString mListenHost;
    qint64 mMaxUploadSize = 0;
    int mRequestTimeoutMs = DefaultRequestTimeoutMs;
};

} // namespace LfsServe

#endif // LFSSERVER_H
