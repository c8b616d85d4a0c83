#ifndef STALLING_LFS_SERVER_H
#define STALLING_LFS_SERVER_H

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QUrl>

#include "HttpMessage.h"

class QTcpSocket;

/**
 * Answers every batch request with transfer actions pointing back at itself,
 * then accepts the transfers and never answers them. Used to drive client
 * timeouts and retries.
 */
class StallingLfsServer : public QObject
{
    Q_OBJECT

public:
    explicit StallingLfsServer(QObject* parent = nullptr);

    bool start();
    QUrl endpoint() const;

    int batchRequestCount() const { return mBatchRequestCount; }
    int transferRequestCount() const { return mTransferRequestCount; }

private:
    void handleNewConnections();
    void handleRequest(QTcpSocket* socket, const LfsServe::HttpRequest& request);
    void respond(QTcpSocket* socket, const LfsServe::HttpResponse& response) const;

    QTcpServer mServer;
    QHash<QTcpSocket*, LfsServe::HttpRequestParser> mParsers;
    int mBatchRequestCount = 0;
    int mTransferRequestCount = 0;
};

#endif // STALLING_LFS_SERVER_H
