//Our includes
#include "ServerConfig.h"
#include "LfsError.h"
#include "LfsProtocol.h"
#include "RepositoryRegistry.h"
#include "UriBuilder.h"

//Qt includes
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <limits>

namespace {

const QString configOption = QStringLiteral("config");
const QString listenOption = QStringLiteral("listen");
const QString selfUrlOption = QStringLiteral("self-url");
const QString upstreamUrlOption = QStringLiteral("upstream-url");
const QString requestTimeoutOption = QStringLiteral("request-timeout");
const QString readOnlyOption = QStringLiteral("readonly-storage");
const QString maxUploadOption = QStringLiteral("max-upload-size");
const QString requestLogOption = QStringLiteral("request-log");
const QString repoOption = QStringLiteral("repo");

Monad::ResultBase configError(const QString& message)
{
    return Monad::ResultBase(QStringLiteral("Invalid configuration: %1").arg(message),
                             LfsServe::toInt(LfsServe::LfsErrorCode::Protocol));
}

Monad::ResultBase checkUpstreamUrl(const QString& upstreamUrl)
{
    if (upstreamUrl.isEmpty()) {
        return Monad::ResultBase();
    }
    const auto uriBuilder = LfsServe::UriBuilder::fromString(upstreamUrl);
    if (uriBuilder.hasError()) {
        return configError(QStringLiteral("upstream url: %1").arg(uriBuilder.errorMessage()));
    }
    return Monad::ResultBase();
}

} // namespace

namespace LfsServe {

Monad::ResultBase ServerConfig::parseListenAddress(const QString& address, QString* hostOut, quint16* portOut)
{
    const int colon = address.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return configError(QStringLiteral("listen address \"%1\" must be host:port").arg(address));
    }

    bool ok = false;
    const uint port = address.mid(colon + 1).toUInt(&ok);
    if (!ok || port > 65535) {
        return configError(QStringLiteral("listen port in \"%1\" is not a valid port").arg(address));
    }

    if (hostOut) {
        *hostOut = address.left(colon);
    }
    if (portOut) {
        *portOut = static_cast<quint16>(port);
    }
    return Monad::ResultBase();
}

Monad::Result<ServerConfig> ServerConfig::fromJson(const QByteArray& json)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (document.isNull() || !document.isObject()) {
        const auto error = configError(parseError.errorString());
        return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
    }

    const QJsonObject root = document.object();
    ServerConfig config;

    if (root.contains(QStringLiteral("listen"))) {
        auto result = parseListenAddress(root.value(QStringLiteral("listen")).toString(),
                                         &config.listenHost,
                                         &config.listenPort);
        if (result.hasError()) {
            return Monad::Result<ServerConfig>(result.errorMessage(), result.errorCode());
        }
    }

    config.selfUrl = root.value(QStringLiteral("selfUrl")).toString();
    config.upstreamUrl = root.value(QStringLiteral("upstreamUrl")).toString();
    const auto upstream = checkUpstreamUrl(config.upstreamUrl);
    if (upstream.hasError()) {
        return Monad::Result<ServerConfig>(upstream.errorMessage(), upstream.errorCode());
    }

    config.readOnlyStorage = root.value(QStringLiteral("readOnlyStorage")).toBool(false);
    config.requestLogPath = root.value(QStringLiteral("requestLog")).toString();

    const QJsonValue maxUploadSize = root.value(QStringLiteral("maxUploadSize"));
    if (!maxUploadSize.isUndefined()) {
        const qint64 limit = sizeFromJson(maxUploadSize);
        if (limit < 0) {
            const auto error = configError(QStringLiteral("maxUploadSize must be a non-negative integer"));
            return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
        }
        config.maxUploadSize = limit;
    }

    const QJsonValue requestTimeout = root.value(QStringLiteral("requestTimeout"));
    if (!requestTimeout.isUndefined()) {
        const qint64 timeoutMs = sizeFromJson(requestTimeout);
        if (timeoutMs <= 0 || timeoutMs > std::numeric_limits<int>::max()) {
            const auto error = configError(QStringLiteral("requestTimeout must be a positive number of milliseconds"));
            return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
        }
        config.requestTimeoutMs = static_cast<int>(timeoutMs);
    }

    const QJsonObject repositories = root.value(QStringLiteral("repositories")).toObject();
    for (auto it = repositories.begin(); it != repositories.end(); ++it) {
        if (!RepositoryRegistry::isValidRepositoryName(it.key())) {
            const auto error = configError(QStringLiteral("repository name \"%1\" is not valid").arg(it.key()));
            return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
        }

        const QJsonObject repoObject = it.value().toObject();
        RepositoryConfig repo;
        repo.name = it.key();

        const QString blobstore = repoObject.value(QStringLiteral("blobstore")).toString(QStringLiteral("memory"));
        if (blobstore == QStringLiteral("memory")) {
            repo.blobstore = RepositoryConfig::BlobstoreType::Memory;
        } else if (blobstore == QStringLiteral("files")) {
            repo.blobstore = RepositoryConfig::BlobstoreType::Files;
            repo.path = repoObject.value(QStringLiteral("path")).toString();
            if (repo.path.isEmpty()) {
                const auto error = configError(QStringLiteral("repository \"%1\" needs a path for a files blobstore").arg(repo.name));
                return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
            }
        } else {
            const auto error = configError(QStringLiteral("repository \"%1\" has unknown blobstore \"%2\"").arg(repo.name, blobstore));
            return Monad::Result<ServerConfig>(error.errorMessage(), error.errorCode());
        }

        config.repositories.append(repo);
    }

    return Monad::Result<ServerConfig>(config);
}

Monad::Result<ServerConfig> ServerConfig::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<ServerConfig>(QStringLiteral("Failed to open config %1: %2").arg(filePath, file.errorString()),
                                           toInt(LfsErrorCode::Io));
    }
    return fromJson(file.readAll());
}

void ServerConfig::addCommandLineOptions(QCommandLineParser* parser)
{
    parser->addOption({configOption, QStringLiteral("JSON configuration file."), QStringLiteral("file")});
    parser->addOption({listenOption, QStringLiteral("Address to listen on, host:port."), QStringLiteral("address")});
    parser->addOption({selfUrlOption, QStringLiteral("Public base url used in batch hrefs."), QStringLiteral("url")});
    parser->addOption({upstreamUrlOption, QStringLiteral("Base url of an LFS server to send downloads of missing objects to."), QStringLiteral("url")});
    parser->addOption({requestTimeoutOption, QStringLiteral("Milliseconds a connection may stay idle before it is answered with 408."), QStringLiteral("ms")});
    parser->addOption({readOnlyOption, QStringLiteral("Error on any attempts to write to storage")});
    parser->addOption({maxUploadOption, QStringLiteral("Largest accepted object, in bytes (0 is unlimited)."), QStringLiteral("bytes")});
    parser->addOption({requestLogOption, QStringLiteral("Append one JSON line per completed request to this file."), QStringLiteral("file")});
    parser->addOption({repoOption, QStringLiteral("Serve a repository: name for memory storage, name=path for file storage."), QStringLiteral("repo")});
}

Monad::ResultBase ServerConfig::applyCommandLine(const QCommandLineParser& parser)
{
    if (parser.isSet(listenOption)) {
        auto result = parseListenAddress(parser.value(listenOption), &listenHost, &listenPort);
        if (result.hasError()) {
            return result;
        }
    }

    if (parser.isSet(selfUrlOption)) {
        selfUrl = parser.value(selfUrlOption);
    }

    if (parser.isSet(upstreamUrlOption)) {
        upstreamUrl = parser.value(upstreamUrlOption);
        auto result = checkUpstreamUrl(upstreamUrl);
        if (result.hasError()) {
            return result;
        }
    }

    if (parser.isSet(requestTimeoutOption)) {
        bool ok = false;
        const int value = parser.value(requestTimeoutOption).toInt(&ok);
        if (!ok || value <= 0) {
            return configError(QStringLiteral("--request-timeout must be a positive number of milliseconds"));
        }
        requestTimeoutMs = value;
    }

    if (parser.isSet(readOnlyOption)) {
        readOnlyStorage = true;
    }

    if (parser.isSet(maxUploadOption)) {
        bool ok = false;
        const qint64 value = parser.value(maxUploadOption).toLongLong(&ok);
        if (!ok || value < 0) {
            return configError(QStringLiteral("--max-upload-size must be a non-negative integer"));
        }
        maxUploadSize = value;
    }

    if (parser.isSet(requestLogOption)) {
        requestLogPath = parser.value(requestLogOption);
    }

    const QStringList repos = parser.values(repoOption);
    for (const QString& value : repos) {
        RepositoryConfig repo;
        const int equals = value.indexOf(QLatin1Char('='));
        repo.name = equals >= 0 ? value.left(equals) : value;
        if (equals >= 0) {
            repo.blobstore = RepositoryConfig::BlobstoreType::Files;
            repo.path = value.mid(equals + 1);
        }
        if (!RepositoryRegistry::isValidRepositoryName(repo.name)
            || (repo.blobstore == RepositoryConfig::BlobstoreType::Files && repo.path.isEmpty())) {
            return configError(QStringLiteral("--repo \"%1\" is not name or name=path").arg(value));
        }
        repositories.append(repo);
    }

    return Monad::ResultBase();
}

} // namespace LfsServe
