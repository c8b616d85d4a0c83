//Our includes
#include "TestUtilities.h"

//Qt includes
#include <QUuid>
#include <QEventLoop>
#include <QHostAddress>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpSocket>
#include <QTimer>

//Catch includes
#include <catch2/catch_test_macros.hpp>

TestUtilities::TestUtilities()
{

}

QDir TestUtilities::createUniqueTempDir()
{
    QDir tempDir = QDir::temp();
    auto tempDirId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    REQUIRE(tempDir.mkdir(tempDirId)); //If this fails the folder already exist, remove it, try again
    tempDir.cd(tempDirId);
    return tempDir;
}

QByteArray TestUtilities::repeated(const QByteArray& line, int count)
{
    QByteArray bytes;
    bytes.reserve(line.size() * count);
    for (int i = 0; i < count; ++i) {
        bytes.append(line);
    }
    return bytes;
}

TestUtilities::HttpReply TestUtilities::sendRequest(const QByteArray& verb,
                                                    const QUrl& url,
                                                    const QByteArray& body,
                                                    int timeoutMs)
{
    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    if (!body.isEmpty()) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/vnd.git-lfs+json"));
    }

    QNetworkReply* reply = manager.sendCustomRequest(request, verb, body);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    loop.exec();

    REQUIRE(reply->isFinished());

    HttpReply result;
    result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.contentType = reply->header(QNetworkRequest::ContentTypeHeader).toByteArray();
    result.body = reply->readAll();
    reply->deleteLater();
    return result;
}

QByteArray TestUtilities::sendRaw(quint16 port, const QByteArray& bytes, int timeoutMs)
{
    QTcpSocket socket;
    socket.connectToHost(QHostAddress::LocalHost, port);
    REQUIRE(socket.waitForConnected(timeoutMs));

    socket.write(bytes);
    socket.flush();

    QByteArray response;
    QEventLoop loop;
    QObject::connect(&socket, &QTcpSocket::readyRead, &loop, [&socket, &response]() {
        response.append(socket.readAll());
    });
    QObject::connect(&socket, &QTcpSocket::disconnected, &loop, &QEventLoop::quit);
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    if (socket.state() == QAbstractSocket::ConnectedState) {
        loop.exec();
    }
    response.append(socket.readAll());
    return response;
}

std::ostream& operator<<(std::ostream& os, const QString& string)
{
    os << string.toStdString();
    return os;
}

std::ostream& operator<<(std::ostream& os, const QStringList& list) {
    for (int i = 0; i < list.size(); ++i) {
        os << list.at(i).toStdString();
        if (i != list.size() - 1)
            os << ", ";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const QByteArray& bytes)
{
    os << bytes.toStdString();
    return os;
}
