#ifndef URIBUILDER_H
#define URIBUILDER_H

#include <QString>
#include <QUrl>

#include "LfsObject.h"
#include "Monad/Result.h"

namespace LfsServe {

/**
 * Builds the transfer hrefs handed out in batch responses. The base url
 * may carry a path prefix, with or without a trailing slash:
 *
 *   http://foo.com/bar  + repo1 -> http://foo.com/bar/repo1/upload/<oid>/<size>
 *
 * An optional upstream server is addressed the same way, its repositories
 * mirror ours by name: <upstream>/<repo>/objects/batch.
 */
class UriBuilder
{
public:
    UriBuilder() = default;

    static Monad::Result<UriBuilder> fromString(const QString& baseUrl);
    static Monad::Result<UriBuilder> fromStrings(const QString& selfUrl, const QString& upstreamUrl);

    bool isValid() const { return mBase.isValid() && !mBase.isEmpty(); }
    QUrl baseUrl() const { return mBase; }

    QUrl uploadUri(const QString& repository, const LfsObject& object) const;
    QUrl downloadUri(const QString& repository, const QString& oid) const;

    bool hasUpstream() const { return !mUpstream.isEmpty(); }
    QUrl upstreamEndpoint(const QString& repository) const;
    QUrl upstreamBatchUri(const QString& repository) const;

private:
    explicit UriBuilder(QUrl base);

    static QUrl build(const QUrl& base, const QString& relativePath);

    QUrl mBase;
    QUrl mUpstream;
};

} // namespace LfsServe

#endif // URIBUILDER_H
