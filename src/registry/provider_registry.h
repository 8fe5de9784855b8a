#pragma once
#include "provider.h"
#include "provider_repository.h"
#include "semantic/ports.h"
#include <QHash>
#include <QMap>
#include <QMutex>
#include <QReadWriteLock>
#include <QStringList>
#include <memory>
#include <optional>

// In-memory view of every provider. The provider map is guarded by a
// read/write lock; each provider's mutable state has a mutex of its own so
// unrelated providers never contend.
class ProviderRegistry {
public:
    ProviderRegistry() = default;

    void setRepository(IProviderRepository* repository) { m_repository = repository; }

    // Reloads static fields from the repository, keeping runtime state of
    // providers that are already known.
    VoidResult refresh();
    VoidResult flush();

    // Validates and installs a provider list. Returns the number accepted.
    int replaceAll(const QList<Provider>& providers);

    QList<Provider> snapshot(AppFamily family) const;
    QList<Provider> snapshotAll() const;
    std::optional<Provider> provider(const QString& id) const;
    int size() const;

    QString activeProvider(AppFamily family) const;
    void setActiveProvider(AppFamily family, const QString& providerId);
    QString activeGroup(AppFamily family) const;

    void recordUsage(const QString& providerId, qint64 nowMs);
    void recordLatency(const QString& providerId, const QString& url, qint64 sampleMs);
    int setUrlCooldown(const QString& providerId, const QString& url, qint64 untilMs);
    bool setProviderCooldown(const QString& providerId, qint64 untilMs);
    bool clearCooldown(const QString& providerId);
    bool resetUsage(const QString& providerId);

    QList<ProviderRuntimeState> runtimeStates() const;

    static QList<Provider> validate(const QList<Provider>& providers);

private:
    struct Slot {
        mutable QMutex mutex;
        Provider provider;
    };

    std::shared_ptr<Slot> slot(const QString& id) const;
    static void mergeStatic(Provider& target, const Provider& fresh);

    IProviderRepository* m_repository = nullptr;

    mutable QReadWriteLock m_lock;
    QHash<QString, std::shared_ptr<Slot>> m_slots;
    QStringList m_order;

    mutable QMutex m_activeMutex;
    QMap<AppFamily, QString> m_active;
};
