#include "BlobstoreFactory.h"
#include "FileBlobstore.h"
#include "LfsError.h"
#include "MemoryBlobstore.h"
#include "ReadOnlyBlobstore.h"

#include <QDebug>
#include <QDir>
#include <QHash>

namespace LfsServe {

Monad::Result<BlobstorePtr> BlobstoreFactory::makeBlobstore(const RepositoryConfig& config, bool readOnly)
{
    BlobstorePtr blobstore;

    switch (config.blobstore) {
    case RepositoryConfig::BlobstoreType::Memory:
        blobstore = std::make_shared<MemoryBlobstore>();
        break;
    case RepositoryConfig::BlobstoreType::Files:
        if (config.path.isEmpty()) {
            return Monad::Result<BlobstorePtr>(QStringLiteral("Repository %1 has no blobstore path").arg(config.name),
                                               toInt(LfsErrorCode::Protocol));
        }
        //A read-only store never creates its root
        if (!readOnly && !QDir().mkpath(config.path)) {
            return Monad::Result<BlobstorePtr>(QStringLiteral("Failed to create blobstore directory %1").arg(config.path),
                                               toInt(LfsErrorCode::Io));
        }
        blobstore = std::make_shared<FileBlobstore>(config.path);
        break;
    }

    if (readOnly) {
        blobstore = std::make_shared<ReadOnlyBlobstore>(blobstore);
    }
    return Monad::Result<BlobstorePtr>(blobstore);
}

Monad::Result<std::shared_ptr<RepositoryRegistry>> BlobstoreFactory::buildRegistry(const ServerConfig& config)
{
    auto registry = std::make_shared<RepositoryRegistry>();

    //Each store serializes its own writers, two stores on one directory would race
    QHash<QString, QString> filesRoots;
    for (const RepositoryConfig& repo : config.repositories) {
        if (repo.blobstore != RepositoryConfig::BlobstoreType::Files) {
            continue;
        }
        const QString root = QDir::cleanPath(QDir(repo.path).absolutePath());
        if (filesRoots.contains(root)) {
            return Monad::Result<std::shared_ptr<RepositoryRegistry>>(
                QStringLiteral("Repositories %1 and %2 share the blobstore directory %3")
                    .arg(filesRoots.value(root), repo.name, root),
                toInt(LfsErrorCode::Protocol));
        }
        filesRoots.insert(root, repo.name);
    }

    for (const RepositoryConfig& repo : config.repositories) {
        auto blobstore = makeBlobstore(repo, config.readOnlyStorage);
        if (blobstore.hasError()) {
            return Monad::Result<std::shared_ptr<RepositoryRegistry>>(blobstore.errorMessage(), blobstore.errorCode());
        }

        qDebug() << "[BlobstoreFactory] repository" << repo.name
                 << (repo.blobstore == RepositoryConfig::BlobstoreType::Files ? repo.path : QStringLiteral("(memory)"))
                 << (config.readOnlyStorage ? "read-only" : "read-write");
        auto registered = registry->registerRepository(repo.name, std::make_shared<ContentStore>(blobstore.value()));
        if (registered.hasError()) {
            return Monad::Result<std::shared_ptr<RepositoryRegistry>>(registered.errorMessage(), registered.errorCode());
        }
    }

    return Monad::Result<std::shared_ptr<RepositoryRegistry>>(registry);
}

} // namespace LfsServe
