#pragma once
#include "provider.h"
#include "semantic/ports.h"
#include <QList>

// Persisted-entity store as seen by the proxy. ConfigStore implements it on
// the JSON configuration document.
class IProviderRepository {
public:
    virtual ~IProviderRepository() = default;

    virtual Result<QList<Provider>> loadProviders() = 0;
    virtual VoidResult storeRuntimeState(const QList<ProviderRuntimeState>& states) = 0;
    virtual VoidResult addProviders(const QList<Provider>& providers) = 0;
    virtual VoidResult setProviderCooldown(const QString& providerId, qint64 untilMs) = 0;
};
