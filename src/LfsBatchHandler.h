#ifndef LFSBATCHHANDLER_H
#define LFSBATCHHANDLER_H

#include <memory>

#include "LfsProtocol.h"
#include "RepositoryRegistry.h"
#include "UriBuilder.h"
#include "Monad/Result.h"

namespace LfsServe {

/**
 * Answers batch negotiations. Each requested object is decided on its own:
 *
 * upload   - already stored: echoed back without actions, the client skips it
 *            missing: an "upload" action pointing at <repo>/upload/<oid>/<size>
 * download - a "download" action pointing at <repo>/download/<oid>; existence
 *            is checked when the transfer happens, not here
 *
 * missingObjects() and mergeUpstream() let the server swap in an upstream
 * server's download actions for objects this server does not hold.
 */
class LfsBatchHandler
{
public:
    LfsBatchHandler(std::shared_ptr<const RepositoryRegistry> registry,
                    UriBuilder uriBuilder,
                    qint64 maxUploadSize = 0);

    const UriBuilder& uriBuilder() const { return mUriBuilder; }

    Monad::Result<BatchResponse> batch(const QString& repository, const BatchRequest& request) const;

    //Valid download objects the repository does not store, empty for uploads
    QVector<LfsObject> missingObjects(const QString& repository, const BatchRequest& request) const;

    //Objects the upstream answered with a download action replace the local entries
    static BatchResponse mergeUpstream(const BatchResponse& local, const BatchResponse& upstream);

private:
    std::shared_ptr<const RepositoryRegistry> mRegistry;
    UriBuilder mUriBuilder;
    qint64 mMaxUploadSize = 0;

    ObjectResponse uploadResponse(const QString& repository, const ContentStore& store, const LfsObject& object) const;
    ObjectResponse downloadResponse(const QString& repository, const LfsObject& object) const;
};

} // namespace LfsServe

#endif // LFSBATCHHANDLER_H
