//Catch includes
#include <catch2/catch_test_macros.hpp>

//Our includes
#include "BlobstoreFactory.h"
#include "LfsError.h"
#include "ServerConfig.h"
#include "TestUtilities.h"

//Qt includes
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

//Std includes
#include <algorithm>

using namespace LfsServe;

TEST_CASE("ServerConfig reads the JSON document", "[ServerConfig]") {
    const QByteArray json = R"({
        "listen": "0.0.0.0:9000",
        "selfUrl": "https://lfs.example.com/prefix",
        "upstreamUrl": "https://upstream.example.com/lfs",
        "requestTimeout": 5000,
        "readOnlyStorage": true,
        "maxUploadSize": 1048576,
        "requestLog": "/tmp/requests.jsonl",
        "repositories": {
            "repo1": { "blobstore": "files", "path": "/var/lib/lfs/repo1" },
            "scratch": { "blobstore": "memory" }
        }
    })";

    auto result = ServerConfig::fromJson(json);
    INFO("Error:" << result.errorMessage().toStdString());
    REQUIRE_FALSE(result.hasError());

    const ServerConfig config = result.value();
    CHECK(config.listenHost == QStringLiteral("0.0.0.0"));
    CHECK(config.listenPort == 9000);
    CHECK(config.selfUrl == QStringLiteral("https://lfs.example.com/prefix"));
    CHECK(config.upstreamUrl == QStringLiteral("https://upstream.example.com/lfs"));
    CHECK(config.requestTimeoutMs == 5000);
    CHECK(config.readOnlyStorage);
    CHECK(config.maxUploadSize == 1048576);
    CHECK(config.requestLogPath == QStringLiteral("/tmp/requests.jsonl"));
    REQUIRE(config.repositories.size() == 2);

    const auto repo1 = std::find_if(config.repositories.begin(), config.repositories.end(),
                                    [](const RepositoryConfig& repo) { return repo.name == QStringLiteral("repo1"); });
    REQUIRE(repo1 != config.repositories.end());
    CHECK(repo1->blobstore == RepositoryConfig::BlobstoreType::Files);
    CHECK(repo1->path == QStringLiteral("/var/lib/lfs/repo1"));
}

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
    auto result = ServerConfig::fromJson("{}");
    REQUIRE_FALSE(result.hasError());
    CHECK(result.value().listenHost == QStringLiteral("127.0.0.1"));
    CHECK(result.value().listenPort == 8000);
    CHECK_FALSE(result.value().readOnlyStorage);
    CHECK(result.value().maxUploadSize == 0);
    CHECK(result.value().upstreamUrl.isEmpty());
    CHECK(result.value().requestTimeoutMs == 30000);
    CHECK(result.value().repositories.isEmpty());
}

TEST_CASE("ServerConfig names the offending field", "[ServerConfig]") {
    SECTION("Listen address without port") {
        auto result = ServerConfig::fromJson(R"({"listen":"localhost"})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("listen")));
    }

    SECTION("Listen port out of range") {
        CHECK(ServerConfig::fromJson(R"({"listen":"127.0.0.1:70000"})").hasError());
    }

    SECTION("Negative upload limit") {
        auto result = ServerConfig::fromJson(R"({"maxUploadSize":-1})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("maxUploadSize")));
    }

    SECTION("Fractional or huge upload limit") {
        CHECK(ServerConfig::fromJson(R"({"maxUploadSize":10.5})").hasError());
        CHECK(ServerConfig::fromJson(R"({"maxUploadSize":1e300})").hasError());
    }

    SECTION("Upstream url without a scheme") {
        auto result = ServerConfig::fromJson(R"({"upstreamUrl":"upstream.example.com"})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("upstream")));
        CHECK(result.errorCode() == toInt(LfsErrorCode::Protocol));
    }

    SECTION("Zero request timeout") {
        auto result = ServerConfig::fromJson(R"({"requestTimeout":0})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("requestTimeout")));
    }

    SECTION("Files blobstore without a path") {
        auto result = ServerConfig::fromJson(R"({"repositories":{"repo1":{"blobstore":"files"}}})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("repo1")));
    }

    SECTION("Unknown blobstore") {
        auto result = ServerConfig::fromJson(R"({"repositories":{"repo1":{"blobstore":"s3"}}})");
        REQUIRE(result.hasError());
        CHECK(result.errorMessage().contains(QStringLiteral("s3")));
    }

    SECTION("Not a JSON object") {
        CHECK(ServerConfig::fromJson("[1,2]").errorCode() == toInt(LfsErrorCode::Protocol));
    }
}

TEST_CASE("ServerConfig loads files and reports missing ones", "[ServerConfig]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());
    const QString path = QDir(tempDir.path()).filePath(QStringLiteral("lfs.json"));

    auto missing = ServerConfig::load(path);
    REQUIRE(missing.hasError());
    CHECK(missing.errorCode() == toInt(LfsErrorCode::Io));

    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write(R"({"listen":"127.0.0.1:0"})");
    file.close();

    auto loaded = ServerConfig::load(path);
    REQUIRE_FALSE(loaded.hasError());
    CHECK(loaded.value().listenPort == 0);
}

TEST_CASE("Command line options override the config document", "[ServerConfig]") {
    QCommandLineParser parser;
    ServerConfig::addCommandLineOptions(&parser);
    REQUIRE(parser.parse({QStringLiteral("lfs-serve"),
                          QStringLiteral("--listen"), QStringLiteral("127.0.0.1:9100"),
                          QStringLiteral("--self-url"), QStringLiteral("http://public.example.com"),
                          QStringLiteral("--upstream-url"), QStringLiteral("http://upstream.example.com"),
                          QStringLiteral("--request-timeout"), QStringLiteral("1500"),
                          QStringLiteral("--readonly-storage"),
                          QStringLiteral("--max-upload-size"), QStringLiteral("4096"),
                          QStringLiteral("--repo"), QStringLiteral("scratch"),
                          QStringLiteral("--repo"), QStringLiteral("repo1=/srv/lfs/repo1")}));

    ServerConfig config;
    auto result = config.applyCommandLine(parser);
    INFO("Error:" << result.errorMessage().toStdString());
    REQUIRE_FALSE(result.hasError());

    CHECK(config.listenPort == 9100);
    CHECK(config.selfUrl == QStringLiteral("http://public.example.com"));
    CHECK(config.upstreamUrl == QStringLiteral("http://upstream.example.com"));
    CHECK(config.requestTimeoutMs == 1500);
    CHECK(config.readOnlyStorage);
    CHECK(config.maxUploadSize == 4096);
    REQUIRE(config.repositories.size() == 2);
    CHECK(config.repositories.at(0).name == QStringLiteral("scratch"));
    CHECK(config.repositories.at(0).blobstore == RepositoryConfig::BlobstoreType::Memory);
    CHECK(config.repositories.at(1).name == QStringLiteral("repo1"));
    CHECK(config.repositories.at(1).path == QStringLiteral("/srv/lfs/repo1"));

    SECTION("Invalid upload limit") {
        QCommandLineParser badParser;
        ServerConfig::addCommandLineOptions(&badParser);
        REQUIRE(badParser.parse({QStringLiteral("lfs-serve"),
                                 QStringLiteral("--max-upload-size"), QStringLiteral("lots")}));
        ServerConfig badConfig;
        CHECK(badConfig.applyCommandLine(badParser).hasError());
    }

    SECTION("Invalid upstream url") {
        QCommandLineParser badParser;
        ServerConfig::addCommandLineOptions(&badParser);
        REQUIRE(badParser.parse({QStringLiteral("lfs-serve"),
                                 QStringLiteral("--upstream-url"), QStringLiteral("/no/host")}));
        ServerConfig badConfig;
        CHECK(badConfig.applyCommandLine(badParser).hasError());
    }
}

TEST_CASE("BlobstoreFactory builds a store per repository", "[ServerConfig]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    ServerConfig config;
    RepositoryConfig files;
    files.name = QStringLiteral("repo1");
    files.blobstore = RepositoryConfig::BlobstoreType::Files;
    files.path = QDir(tempDir.path()).filePath(QStringLiteral("repo1"));
    RepositoryConfig memory;
    memory.name = QStringLiteral("scratch");
    config.repositories = {files, memory};

    SECTION("Read-write") {
        auto registry = BlobstoreFactory::buildRegistry(config);
        REQUIRE_FALSE(registry.hasError());
        CHECK(registry.value()->repositoryNames() == QStringList{QStringLiteral("repo1"), QStringLiteral("scratch")});
        CHECK(QDir(files.path).exists());

        auto store = registry.value()->storeFor(QStringLiteral("repo1"));
        REQUIRE(store != nullptr);
        CHECK_FALSE(store->isReadOnly());
        auto stored = store->storeBytes(QByteArray("on disk"));
        REQUIRE_FALSE(stored.hasError());
        CHECK(store->has(stored.value().oid));
    }

    SECTION("Read-only wraps every store") {
        config.readOnlyStorage = true;
        auto registry = BlobstoreFactory::buildRegistry(config);
        REQUIRE_FALSE(registry.hasError());
        CHECK(registry.value()->storeFor(QStringLiteral("repo1"))->isReadOnly());
        CHECK(registry.value()->storeFor(QStringLiteral("scratch"))->isReadOnly());
        CHECK_FALSE(QDir(files.path).exists());
    }
}

TEST_CASE("BlobstoreFactory refuses two repositories on one directory", "[ServerConfig]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    RepositoryConfig first;
    first.name = QStringLiteral("repo1");
    first.blobstore = RepositoryConfig::BlobstoreType::Files;
    first.path = QDir(tempDir.path()).filePath(QStringLiteral("shared"));

    RepositoryConfig second = first;
    second.name = QStringLiteral("repo2");
    second.path = QDir(tempDir.path()).filePath(QStringLiteral("other/../shared/"));

    ServerConfig config;
    config.repositories = {first, second};

    auto registry = BlobstoreFactory::buildRegistry(config);
    REQUIRE(registry.hasError());
    CHECK(registry.errorCode() == toInt(LfsErrorCode::Protocol));
    CHECK(registry.errorMessage().contains(QStringLiteral("repo1")));
    CHECK(registry.errorMessage().contains(QStringLiteral("repo2")));

    SECTION("Distinct directories are fine") {
        config.repositories[1].path = QDir(tempDir.path()).filePath(QStringLiteral("repo2"));
        CHECK_FALSE(BlobstoreFactory::buildRegistry(config).hasError());
    }
}
