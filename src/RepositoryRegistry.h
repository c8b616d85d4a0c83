#ifndef REPOSITORYREGISTRY_H
#define REPOSITORYREGISTRY_H

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "ContentStore.h"
#include "Monad/Result.h"

namespace LfsServe {

class RepositoryRegistry
{
public:
    RepositoryRegistry() = default;

    Monad::ResultBase registerRepository(const QString& name, const ContentStorePtr& store);
    void unregisterRepository(const QString& name);

    ContentStorePtr storeFor(const QString& name) const;
    Monad::Result<ContentStorePtr> lookup(const QString& name) const;
    QStringList repositoryNames() const;

    static bool isValidRepositoryName(const QString& name);

private:
    mutable QMutex mMutex;
    QHash<QString, ContentStorePtr> mStores;
};

} // namespace LfsServe

#endif // REPOSITORYREGISTRY_H
