//Catch includes
#include <catch2/catch_test_macros.hpp>

//Our includes
#include "LfsError.h"
#include "UriBuilder.h"
#include "TestUtilities.h"

using namespace LfsServe;

namespace {
const QString onesHash(64, QLatin1Char('1'));
const qint64 objectSize = 123;
const QString repository = QStringLiteral("repo123");

UriBuilder builder(const QString& base)
{
    auto result = UriBuilder::fromString(base);
    INFO("Base:" << base.toStdString() << " error:" << result.errorMessage().toStdString());
    REQUIRE_FALSE(result.hasError());
    return result.value();
}
}

TEST_CASE("UriBuilder composes upload hrefs", "[UriBuilder]") {
    const LfsObject object{onesHash, objectSize};
    const QString expectedRoot = QStringLiteral("http://foo.com/repo123/upload/%1/%2").arg(onesHash).arg(objectSize);
    const QString expectedPrefix = QStringLiteral("http://foo.com/bar/repo123/upload/%1/%2").arg(onesHash).arg(objectSize);

    CHECK(builder(QStringLiteral("http://foo.com")).uploadUri(repository, object).toString() == expectedRoot);
    CHECK(builder(QStringLiteral("http://foo.com/")).uploadUri(repository, object).toString() == expectedRoot);
    CHECK(builder(QStringLiteral("http://foo.com/bar")).uploadUri(repository, object).toString() == expectedPrefix);
    CHECK(builder(QStringLiteral("http://foo.com/bar/")).uploadUri(repository, object).toString() == expectedPrefix);
}

TEST_CASE("UriBuilder composes download hrefs", "[UriBuilder]") {
    const QString expectedRoot = QStringLiteral("http://foo.com/repo123/download/%1").arg(onesHash);
    const QString expectedPrefix = QStringLiteral("http://foo.com/bar/repo123/download/%1").arg(onesHash);

    CHECK(builder(QStringLiteral("http://foo.com")).downloadUri(repository, onesHash).toString() == expectedRoot);
    CHECK(builder(QStringLiteral("http://foo.com/")).downloadUri(repository, onesHash).toString() == expectedRoot);
    CHECK(builder(QStringLiteral("http://foo.com/bar")).downloadUri(repository, onesHash).toString() == expectedPrefix);
    CHECK(builder(QStringLiteral("http://foo.com/bar/")).downloadUri(repository, onesHash).toString() == expectedPrefix);
}

TEST_CASE("UriBuilder keeps the port", "[UriBuilder]") {
    const UriBuilder b = builder(QStringLiteral("http://127.0.0.1:8123"));
    CHECK(b.downloadUri(repository, onesHash).port() == 8123);
    CHECK(b.isValid());
    CHECK_FALSE(b.hasUpstream());
    CHECK(b.upstreamEndpoint(repository).isEmpty());
    CHECK(b.upstreamBatchUri(repository).isEmpty());
}

TEST_CASE("UriBuilder does not expand placeholders in repository names", "[UriBuilder]") {
    const UriBuilder b = builder(QStringLiteral("http://foo.com"));
    const LfsObject object{onesHash, objectSize};
    CHECK(b.uploadUri(QStringLiteral("repo%1"), object).path()
          == QStringLiteral("/repo%1/upload/%2/%3").arg(QStringLiteral("%1"), onesHash, QString::number(objectSize)));
    CHECK(b.downloadUri(QStringLiteral("repo%2"), onesHash).path()
          == QStringLiteral("/repo%2/download/") + onesHash);
}

TEST_CASE("UriBuilder addresses the upstream server", "[UriBuilder]") {
    auto result = UriBuilder::fromStrings(QStringLiteral("http://foo.com/bar"), QStringLiteral("http://upstream.com/lfs/"));
    REQUIRE_FALSE(result.hasError());
    const UriBuilder b = result.value();

    CHECK(b.hasUpstream());
    CHECK(b.upstreamEndpoint(repository).toString() == QStringLiteral("http://upstream.com/lfs/repo123"));
    CHECK(b.upstreamBatchUri(repository).toString() == QStringLiteral("http://upstream.com/lfs/repo123/objects/batch"));
    CHECK(b.downloadUri(repository, onesHash).toString() == QStringLiteral("http://foo.com/bar/repo123/download/%1").arg(onesHash));

    SECTION("An empty upstream means none") {
        auto none = UriBuilder::fromStrings(QStringLiteral("http://foo.com"), QString());
        REQUIRE_FALSE(none.hasError());
        CHECK_FALSE(none.value().hasUpstream());
    }

    SECTION("A malformed upstream is rejected") {
        auto bad = UriBuilder::fromStrings(QStringLiteral("http://foo.com"), QStringLiteral("upstream.com"));
        REQUIRE(bad.hasError());
        CHECK(bad.errorMessage().contains(QStringLiteral("missing scheme")));
    }
}

TEST_CASE("UriBuilder rejects base urls without scheme or host", "[UriBuilder]") {
    auto noScheme = UriBuilder::fromString(QStringLiteral("foo.com/bar"));
    REQUIRE(noScheme.hasError());
    CHECK(noScheme.errorCode() == toInt(LfsErrorCode::Protocol));

    auto noHost = UriBuilder::fromString(QStringLiteral("file:///tmp/lfs"));
    REQUIRE(noHost.hasError());
    CHECK(noHost.errorMessage().contains(QStringLiteral("missing authority")));

    CHECK_FALSE(UriBuilder().isValid());
}
