#ifndef BLOBSTOREFACTORY_H
#define BLOBSTOREFACTORY_H

#include <memory>

#include "Blobstore.h"
#include "RepositoryRegistry.h"
#include "ServerConfig.h"
#include "Monad/Result.h"

namespace LfsServe {

class BlobstoreFactory
{
public:
    //Wraps the store in a ReadOnlyBlobstore when readOnly is set
    static Monad::Result<BlobstorePtr> makeBlobstore(const RepositoryConfig& config, bool readOnly);

    static Monad::Result<std::shared_ptr<RepositoryRegistry>> buildRegistry(const ServerConfig& config);
};

} // namespace LfsServe

#endif // BLOBSTOREFACTORY_H
