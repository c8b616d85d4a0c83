#include "RepositoryRegistry.h"
#include "LfsError.h"

#include <QMutexLocker>
#include <algorithm>

namespace LfsServe {

bool RepositoryRegistry::isValidRepositoryName(const QString& name)
{
    if (name.isEmpty() || name == QStringLiteral(".") || name == QStringLiteral("..")) {
        return false;
    }
    return !name.contains(QLatin1Char('/')) && !name.contains(QLatin1Char('\\'));
}

Monad::ResultBase RepositoryRegistry::registerRepository(const QString& name, const ContentStorePtr& store)
{
    if (!isValidRepositoryName(name)) {
        return Monad::ResultBase(QStringLiteral("Invalid repository name: %1").arg(name),
                                 toInt(LfsErrorCode::Protocol));
    }
    if (!store) {
        return Monad::ResultBase(QStringLiteral("Repository %1 has no store").arg(name),
                                 toInt(LfsErrorCode::Protocol));
    }
    QMutexLocker locker(&mMutex);
    mStores.insert(name, store);
    return Monad::ResultBase();
}

void RepositoryRegistry::unregisterRepository(const QString& name)
{
    QMutexLocker locker(&mMutex);
    mStores.remove(name);
}

ContentStorePtr RepositoryRegistry::storeFor(const QString& name) const
{
    QMutexLocker locker(&mMutex);
    return mStores.value(name);
}

Monad::Result<ContentStorePtr> RepositoryRegistry::lookup(const QString& name) const
{
    auto store = storeFor(name);
    if (!store) {
        return Monad::Result<ContentStorePtr>(QStringLiteral("Repository does not exist: %1").arg(name),
                                              toInt(LfsErrorCode::RepositoryNotFound));
    }
    return Monad::Result<ContentStorePtr>(store);
}

QStringList RepositoryRegistry::repositoryNames() const
{
    QMutexLocker locker(&mMutex);
    QStringList names = mStores.keys();
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace LfsServe
