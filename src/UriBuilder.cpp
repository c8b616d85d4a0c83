#include "UriBuilder.h"
#include "LfsError.h"

namespace LfsServe {

UriBuilder::UriBuilder(QUrl base)
    : mBase(std::move(base))
{
}

Monad::Result<UriBuilder> UriBuilder::fromString(const QString& baseUrl)
{
    const QUrl url(baseUrl, QUrl::StrictMode);
    if (!url.isValid()) {
        return Monad::Result<UriBuilder>(QStringLiteral("Invalid uri %1: %2").arg(baseUrl, url.errorString()),
                                         toInt(LfsErrorCode::Protocol));
    }
    if (url.scheme().isEmpty()) {
        return Monad::Result<UriBuilder>(QStringLiteral("Invalid uri %1: missing scheme").arg(baseUrl),
                                         toInt(LfsErrorCode::Protocol));
    }
    if (url.host().isEmpty()) {
        return Monad::Result<UriBuilder>(QStringLiteral("Invalid uri %1: missing authority").arg(baseUrl),
                                         toInt(LfsErrorCode::Protocol));
    }
    return Monad::Result<UriBuilder>(UriBuilder(url));
}

Monad::Result<UriBuilder> UriBuilder::fromStrings(const QString& selfUrl, const QString& upstreamUrl)
{
    auto self = fromString(selfUrl);
    if (self.hasError() || upstreamUrl.isEmpty()) {
        return self;
    }

    const auto upstream = fromString(upstreamUrl);
    if (upstream.hasError()) {
        return Monad::Result<UriBuilder>(upstream.errorMessage(), upstream.errorCode());
    }

    UriBuilder builder = self.value();
    builder.mUpstream = upstream.value().mBase;
    return Monad::Result<UriBuilder>(builder);
}

QUrl UriBuilder::build(const QUrl& base, const QString& relativePath)
{
    QString path = base.path();
    if (!path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }
    path += relativePath;

    QUrl url(base);
    url.setPath(path);
    url.setQuery(QString());
    url.setFragment(QString());
    return url;
}

QUrl UriBuilder::uploadUri(const QString& repository, const LfsObject& object) const
{
    return build(mBase, QStringLiteral("%1/upload/%2/%3").arg(repository, object.oid, QString::number(object.size)));
}

QUrl UriBuilder::downloadUri(const QString& repository, const QString& oid) const
{
    return build(mBase, QStringLiteral("%1/download/%2").arg(repository, oid));
}

QUrl UriBuilder::upstreamEndpoint(const QString& repository) const
{
    if (!hasUpstream()) {
        return QUrl();
    }
    return build(mUpstream, repository);
}

QUrl UriBuilder::upstreamBatchUri(const QString& repository) const
{
    if (!hasUpstream()) {
        return QUrl();
    }
    return build(mUpstream, QStringLiteral("%1/objects/batch").arg(repository));
}

} // namespace LfsServe
