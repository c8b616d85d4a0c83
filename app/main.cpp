//Qt includes
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

//Our includes
#include "BlobstoreFactory.h"
#include "LfsServer.h"
#include "ServerConfig.h"

using namespace LfsServe;

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("lfs-serve");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Content-addressed Git LFS object server");
    parser.addHelpOption();
    parser.addVersionOption();
    ServerConfig::addCommandLineOptions(&parser);
    parser.process(app);

    ServerConfig config;
    if (parser.isSet("config")) {
        auto loaded = ServerConfig::load(parser.value("config"));
        if (loaded.hasError()) {
            qCritical() << "[lfs-serve]" << loaded.errorMessage();
            return 1;
        }
        config = loaded.value();
    }

    auto applied = config.applyCommandLine(parser);
    if (applied.hasError()) {
        qCritical() << "[lfs-serve]" << applied.errorMessage();
        return 1;
    }

    if (config.repositories.isEmpty()) {
        qWarning() << "[lfs-serve] no repositories configured, every request will be answered with 404";
    }

    auto registry = BlobstoreFactory::buildRegistry(config);
    if (registry.hasError()) {
        qCritical() << "[lfs-serve]" << registry.errorMessage();
        return 1;
    }

    LfsServer server(registry.value());
    server.setSelfUrl(config.selfUrl);
    server.setMaxUploadSize(config.maxUploadSize);
    server.setUpstreamUrl(config.upstreamUrl);
    server.setRequestTimeout(config.requestTimeoutMs);

    if (!config.requestLogPath.isEmpty()) {
        auto logResult = server.requestLog()->setFilePath(config.requestLogPath);
        if (logResult.hasError()) {
            qCritical() << "[lfs-serve]" << logResult.errorMessage();
            return 1;
        }
    }

    auto started = server.start(config.listenHost, config.listenPort);
    if (started.hasError()) {
        qCritical() << "[lfs-serve]" << started.errorMessage();
        return 1;
    }

    return app.exec();
}
