#ifndef SERVERCONFIG_H
#define SERVERCONFIG_H

//Qt includes
#include <QString>
#include <QVector>

#include "Monad/Result.h"

class QCommandLineParser;

namespace LfsServe {

struct RepositoryConfig {
    enum class BlobstoreType {
        Memory,
        Files
    };

    QString name;
    BlobstoreType blobstore = BlobstoreType::Memory;
    QString path;
};

class ServerConfig
{
public:
    ServerConfig() = default;

    QString listenHost = QStringLiteral("127.0.0.1");
    quint16 listenPort = 8000;
    QString selfUrl;
    QString upstreamUrl; //!< empty when there is no upstream LFS server
    bool readOnlyStorage = false;
    qint64 maxUploadSize = 0; //!< 0 is unlimited
    int requestTimeoutMs = 30000;
    QString requestLogPath;
    QVector<RepositoryConfig> repositories;

    static Monad::Result<ServerConfig> fromJson(const QByteArray& json);
    static Monad::Result<ServerConfig> load(const QString& filePath);

    static void addCommandLineOptions(QCommandLineParser* parser);
    Monad::ResultBase applyCommandLine(const QCommandLineParser& parser);

    static Monad::ResultBase parseListenAddress(const QString& address, QString* hostOut, quint16* portOut);
};

} // namespace LfsServe

#endif // SERVERCONFIG_H
