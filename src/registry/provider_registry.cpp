#include "provider_registry.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>
#include <QSet>
#include <cmath>

namespace {

constexpr double kLatencyKeepWeight = 0.7;

QString sortSlotKey(const Provider& p)
{
    return app_family::name(p.family) + QLatin1Char('/') + p.effectiveGroup();
}

}

QList<Provider> ProviderRegistry::validate(const QList<Provider>& providers)
{
    QList<Provider> accepted;
    QSet<QString> seenIds;
    QHash<QString, QSet<int>> sortIndexes;

    for (Provider p : providers) {
        if (p.id.trimmed().isEmpty()) {
            LOG_WARNING(QStringLiteral("ProviderRegistry: config_invalid: provider '%1' has no id, skipped")
                            .arg(p.name));
            continue;
        }
        if (seenIds.contains(p.id)) {
            LOG_WARNING(QStringLiteral("ProviderRegistry: config_invalid: duplicate provider id '%1', skipped")
                            .arg(p.id));
            continue;
        }

        QList<ProviderEndpoint> endpoints;
        for (const ProviderEndpoint& ep : p.endpoints) {
            if (!ep.isUsable()) {
                LOG_WARNING(QStringLiteral("ProviderRegistry: config_invalid: provider '%1' endpoint '%2' "
                                           "has no usable url/key, dropped")
                                .arg(p.id, ep.url));
                continue;
            }
            bool duplicate = false;
            for (const ProviderEndpoint& kept : endpoints) {
                if (kept.url == ep.url && kept.apiKey == ep.apiKey) {
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate)
                endpoints.append(ep);
        }
        if (endpoints.isEmpty()) {
            LOG_WARNING(QStringLiteral("ProviderRegistry: config_invalid: provider '%1' has no usable endpoint, skipped")
                            .arg(p.id));
            continue;
        }
        p.endpoints = endpoints;

        QSet<int>& used = sortIndexes[sortSlotKey(p)];
        if (used.contains(p.sortIndex)) {
            LOG_WARNING(QStringLiteral("ProviderRegistry: config_invalid: provider '%1' repeats sort_index %2 "
                                       "in group '%3', skipped")
                            .arg(p.id)
                            .arg(p.sortIndex)
                            .arg(p.effectiveGroup()));
            continue;
        }
        used.insert(p.sortIndex);

        if (p.cooldownDurationSecs <= 0)
            p.cooldownDurationSecs = kDefaultCooldownSeconds;

        seenIds.insert(p.id);
        accepted.append(p);
    }
    return accepted;
}

void ProviderRegistry::mergeStatic(Provider& target, const Provider& fresh)
{
    QList<ProviderEndpoint> endpoints = fresh.endpoints;
    for (ProviderEndpoint& ep : endpoints) {
        const int old = target.endpointIndex(ep.url, ep.apiKey);
        if (old >= 0) {
            ep.urlLatencyMs = target.endpoints[old].urlLatencyMs;
            ep.cooldownUntil = target.endpoints[old].cooldownUntil;
        }
    }

    const qint64 usageCount = target.usageCount;
    const qint64 lastUsedAt = target.lastUsedAt;
    const qint64 cooldownUntil = target.cooldownUntil;

    target = fresh;
    target.endpoints = endpoints;
    target.usageCount = usageCount;
    target.lastUsedAt = lastUsedAt;
    target.cooldownUntil = cooldownUntil;
}

int ProviderRegistry::replaceAll(const QList<Provider>& providers)
{
    const QList<Provider> accepted = validate(providers);

    QWriteLocker locker(&m_lock);
    QHash<QString, std::shared_ptr<Slot>> next;
    QStringList order;
    for (const Provider& p : accepted) {
        auto existing = m_slots.value(p.id);
        if (existing) {
            QMutexLocker slotLocker(&existing->mutex);
            mergeStatic(existing->provider, p);
            next.insert(p.id, existing);
        } else {
            auto fresh = std::make_shared<Slot>();
            fresh->provider = p;
            next.insert(p.id, fresh);
        }
        order.append(p.id);
    }

    int removed = 0;
    for (auto it = m_slots.cbegin(); it != m_slots.cend(); ++it) {
        if (!next.contains(it.key()))
            ++removed;
    }
    if (removed > 0)
        LOG_INFO(QStringLiteral("ProviderRegistry: %1 provider(s) removed").arg(removed));

    m_slots = next;
    m_order = order;
    return accepted.size();
}

VoidResult ProviderRegistry::refresh()
{
    if (!m_repository)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no provider repository")));

    auto loaded = m_repository->loadProviders();
    if (!loaded)
        return std::unexpected(loaded.error());

    const int accepted = replaceAll(*loaded);
    LOG_DEBUG(QStringLiteral("ProviderRegistry: refreshed, %1/%2 providers accepted")
                  .arg(accepted)
                  .arg(loaded->size()));
    return {};
}

VoidResult ProviderRegistry::flush()
{
    if (!m_repository)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no provider repository")));
    return m_repository->storeRuntimeState(runtimeStates());
}

std::shared_ptr<ProviderRegistry::Slot> ProviderRegistry::slot(const QString& id) const
{
    QReadLocker locker(&m_lock);
    return m_slots.value(id);
}

QList<Provider> ProviderRegistry::snapshot(AppFamily family) const
{
    QList<Provider> result;
    QReadLocker locker(&m_lock);
    result.reserve(m_order.size());
    for (const QString& id : m_order) {
        const auto& s = m_slots.value(id);
        QMutexLocker slotLocker(&s->mutex);
        if (s->provider.family == family)
            result.append(s->provider);
    }
    return result;
}

QList<Provider> ProviderRegistry::snapshotAll() const
{
    QList<Provider> result;
    QReadLocker locker(&m_lock);
    result.reserve(m_order.size());
    for (const QString& id : m_order) {
        const auto& s = m_slots.value(id);
        QMutexLocker slotLocker(&s->mutex);
        result.append(s->provider);
    }
    return result;
}

std::optional<Provider> ProviderRegistry::provider(const QString& id) const
{
    auto s = slot(id);
    if (!s)
        return std::nullopt;
    QMutexLocker locker(&s->mutex);
    return s->provider;
}

int ProviderRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return m_slots.size();
}

QString ProviderRegistry::activeProvider(AppFamily family) const
{
    QMutexLocker locker(&m_activeMutex);
    return m_active.value(family);
}

void ProviderRegistry::setActiveProvider(AppFamily family, const QString& providerId)
{
    QMutexLocker locker(&m_activeMutex);
    if (m_active.value(family) == providerId)
        return;
    m_active[family] = providerId;
    LOG_INFO(QStringLiteral("ProviderRegistry: active %1 provider is now '%2'")
                 .arg(app_family::name(family), providerId));
}

QString ProviderRegistry::activeGroup(AppFamily family) const
{
    const QString id = activeProvider(family);
    if (id.isEmpty())
        return QString();
    const auto p = provider(id);
    if (!p || p->family != family)
        return QString();
    return p->effectiveGroup();
}

void ProviderRegistry::recordUsage(const QString& providerId, qint64 nowMs)
{
    auto s = slot(providerId);
    if (!s)
        return;
    QMutexLocker locker(&s->mutex);
    ++s->provider.usageCount;
    s->provider.lastUsedAt = qMax(s->provider.lastUsedAt, nowMs);
}

void ProviderRegistry::recordLatency(const QString& providerId, const QString& url, qint64 sampleMs)
{
    if (sampleMs < 0)
        return;
    auto s = slot(providerId);
    if (!s)
        return;
    QMutexLocker locker(&s->mutex);
    for (ProviderEndpoint& ep : s->provider.endpoints) {
        if (ep.url != url)
            continue;
        if (ep.urlLatencyMs < 0) {
            ep.urlLatencyMs = sampleMs;
        } else {
            ep.urlLatencyMs = std::llround(ep.urlLatencyMs * kLatencyKeepWeight
                                           + sampleMs * (1.0 - kLatencyKeepWeight));
        }
    }
}

int ProviderRegistry::setUrlCooldown(const QString& providerId, const QString& url, qint64 untilMs)
{
    auto s = slot(providerId);
    if (!s)
        return 0;
    QMutexLocker locker(&s->mutex);
    int changed = 0;
    for (ProviderEndpoint& ep : s->provider.endpoints) {
        if (ep.url == url) {
            ep.cooldownUntil = untilMs;
            ++changed;
        }
    }
    return changed;
}

bool ProviderRegistry::setProviderCooldown(const QString& providerId, qint64 untilMs)
{
    auto s = slot(providerId);
    if (!s)
        return false;
    QMutexLocker locker(&s->mutex);
    s->provider.cooldownUntil = untilMs;
    return true;
}

bool ProviderRegistry::clearCooldown(const QString& providerId)
{
    auto s = slot(providerId);
    if (!s)
        return false;
    QMutexLocker locker(&s->mutex);
    s->provider.cooldownUntil = 0;
    for (ProviderEndpoint& ep : s->provider.endpoints)
        ep.cooldownUntil = 0;
    return true;
}

bool ProviderRegistry::resetUsage(const QString& providerId)
{
    auto s = slot(providerId);
    if (!s)
        return false;
    QMutexLocker locker(&s->mutex);
    s->provider.usageCount = 0;
    return true;
}

QList<ProviderRuntimeState> ProviderRegistry::runtimeStates() const
{
    QList<ProviderRuntimeState> states;
    for (const Provider& p : snapshotAll()) {
        ProviderRuntimeState state;
        state.id = p.id;
        state.usageCount = p.usageCount;
        state.lastUsedAt = p.lastUsedAt;
        state.cooldownUntil = p.cooldownUntil;
        for (const ProviderEndpoint& ep : p.endpoints)
            state.endpoints.append({ep.url, ep.apiKey, ep.urlLatencyMs, ep.cooldownUntil});
        states.append(state);
    }
    return states;
}
