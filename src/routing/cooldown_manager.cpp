#include "cooldown_manager.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <algorithm>
#include <cmath>

CooldownManager::CooldownManager(ProviderRegistry& registry, const BreakerBoard& breakers,
                                 const Clock& clock, const CooldownOptions& options)
    : m_registry(registry)
    , m_breakers(breakers)
    , m_clock(clock)
    , m_options(options)
{
}

void CooldownManager::setOptions(const CooldownOptions& options)
{
    QMutexLocker locker(&m_mutex);
    m_options = options;
}

QString CooldownManager::scopeKey(const Provider& provider)
{
    return app_family::name(provider.family) + QLatin1Char('/') + provider.effectiveGroup();
}

std::shared_ptr<CooldownManager::Scope> CooldownManager::scope(const QString& key, bool create) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_scopes.find(key);
    if (it != m_scopes.end())
        return it.value();
    if (!create)
        return nullptr;
    auto fresh = std::make_shared<Scope>();
    m_scopes.insert(key, fresh);
    return fresh;
}

QList<CooldownManager::MarkerKey> CooldownManager::combinationsOf(const Provider& provider) const
{
    QList<MarkerKey> combos;
    const QString group = provider.effectiveGroup();
    for (const Provider& p : m_registry.snapshot(provider.family)) {
        if (p.effectiveGroup() != group)
            continue;
        for (const ProviderEndpoint& ep : p.endpoints) {
            const MarkerKey key{ep.apiKey, ep.url};
            if (!combos.contains(key))
                combos.append(key);
        }
    }
    return combos;
}

void CooldownManager::pruneExpired(Scope& s, qint64 nowMs) const
{
    qint64 ttlMs = 0;
    {
        QMutexLocker locker(&m_mutex);
        ttlMs = m_options.failureMarkerTtlSeconds * 1000;
    }
    if (ttlMs <= 0)
        return;
    for (auto it = s.markers.begin(); it != s.markers.end();) {
        if (nowMs - it.value() > ttlMs)
            it = s.markers.erase(it);
        else
            ++it;
    }
}

bool CooldownManager::allFailed(const QList<MarkerKey>& combinations,
                                const QHash<MarkerKey, qint64>& markers)
{
    if (combinations.isEmpty())
        return false;
    return std::all_of(combinations.cbegin(), combinations.cend(),
                       [&markers](const MarkerKey& k) { return markers.contains(k); });
}

void CooldownManager::recordFailure(const Candidate& candidate)
{
    if (!m_breakers.isOpen(candidate.id()))
        return;

    const qint64 now = m_clock.nowMs();
    const ProviderEndpoint& ep = candidate.endpoint();
    const QList<MarkerKey> combos = combinationsOf(candidate.provider);
    auto s = scope(scopeKey(candidate.provider), true);

    QMutexLocker locker(&s->mutex);
    pruneExpired(*s, now);
    s->markers.insert({ep.apiKey, ep.url}, now);
    LOG_DEBUG(QStringLiteral("Cooldown: failure marker for %1").arg(candidate.id().toString()));

    if (!s->outageWarned && allFailed(combos, s->markers)) {
        s->outageWarned = true;
        LOG_WARNING(QStringLiteral("Cooldown: every key/URL combination of group '%1' (%2) is failing; "
                                   "treating it as an outage, no cooldown will be applied")
                        .arg(candidate.provider.effectiveGroup(),
                             app_family::name(candidate.provider.family)));
    }
}

int CooldownManager::recordSuccess(const Candidate& candidate)
{
    const qint64 now = m_clock.nowMs();
    const ProviderEndpoint& ok = candidate.endpoint();
    auto s = scope(scopeKey(candidate.provider), false);
    if (!s)
        return 0;

    const QList<MarkerKey> combos = combinationsOf(candidate.provider);
    QStringList failingUrls;
    {
        QMutexLocker locker(&s->mutex);
        pruneExpired(*s, now);
        s->outageWarned = false;

        for (auto it = s->markers.cbegin(); it != s->markers.cend(); ++it) {
            if (it.key().apiKey == ok.apiKey && it.key().url != ok.url
                && !failingUrls.contains(it.key().url)) {
                failingUrls.append(it.key().url);
            }
        }

        if (!failingUrls.isEmpty() && allFailed(combos, s->markers)) {
            LOG_WARNING(QStringLiteral("Cooldown: all key/URL combinations of group '%1' failed before "
                                       "this success; skipping cooldown")
                            .arg(candidate.provider.effectiveGroup()));
            for (auto it = s->markers.begin(); it != s->markers.end();) {
                if (it.key().apiKey == ok.apiKey)
                    it = s->markers.erase(it);
                else
                    ++it;
            }
            return 0;
        }

        s->markers.remove({ok.apiKey, ok.url});
        for (const QString& url : failingUrls)
            s->markers.remove({ok.apiKey, url});
    }

    if (failingUrls.isEmpty())
        return 0;

    qint64 defaultSecs = kDefaultCooldownSeconds;
    {
        QMutexLocker locker(&m_mutex);
        defaultSecs = m_options.defaultDurationSeconds;
    }

    const QString group = candidate.provider.effectiveGroup();
    int cooled = 0;
    for (const QString& url : failingUrls) {
        for (const Provider& p : m_registry.snapshot(candidate.provider.family)) {
            if (p.effectiveGroup() != group)
                continue;
            const qint64 secs = qMin(p.cooldownDurationSecs > 0 ? p.cooldownDurationSecs : defaultSecs,
                                     kMaxCooldownSeconds);
            if (m_registry.setUrlCooldown(p.id, url, now + secs * 1000) > 0) {
                LOG_WARNING(QStringLiteral("Cooldown: %1 url %2 cooled down for %3s "
                                           "(key %4 works on %5)")
                                .arg(p.id, url)
                                .arg(secs)
                                .arg(maskApiKey(ok.apiKey), ok.url));
            }
        }
        ++cooled;
    }
    return cooled;
}

QList<CooldownEntry> CooldownManager::listCooldowns() const
{
    const qint64 now = m_clock.nowMs();
    QList<CooldownEntry> entries;
    for (const Provider& p : m_registry.snapshotAll()) {
        const qint64 until = p.latestCooldownUntil();
        if (until <= now)
            continue;

        CooldownEntry entry;
        entry.providerId = p.id;
        entry.name = p.name;
        entry.group = p.effectiveGroup();
        entry.family = p.family;
        entry.remainingSeconds = static_cast<qint64>(std::ceil((until - now) / 1000.0));
        if (!p.isCoolingDown(now)) {
            for (const ProviderEndpoint& ep : p.endpoints) {
                if (ep.cooldownUntil > now && !entry.urls.contains(ep.url))
                    entry.urls.append(ep.url);
            }
        }
        entries.append(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const CooldownEntry& a, const CooldownEntry& b) {
        return a.providerId < b.providerId;
    });
    return entries;
}

VoidResult CooldownManager::setCooldown(const QString& providerId, double hours)
{
    if (!std::isfinite(hours) || hours < 0.0 || hours > kMaxCooldownHours)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_duration"),
            QStringLiteral("cooldown hours must be between 0 and %1").arg(kMaxCooldownHours)));

    const qint64 until = m_clock.nowMs() + static_cast<qint64>(std::llround(hours * 3600.0 * 1000.0));
    if (!m_registry.setProviderCooldown(providerId, until))
        return std::unexpected(DomainFailure::notFound(
            QStringLiteral("unknown provider '%1'").arg(providerId)));

    LOG_INFO(QStringLiteral("Cooldown: provider %1 set to cool down for %2h").arg(providerId).arg(hours));
    return {};
}

VoidResult CooldownManager::clearCooldown(const QString& providerId)
{
    const auto provider = m_registry.provider(providerId);
    if (!provider)
        return std::unexpected(DomainFailure::notFound(
            QStringLiteral("unknown provider '%1'").arg(providerId)));

    const bool wasCooling = provider->latestCooldownUntil() > m_clock.nowMs();
    m_registry.clearCooldown(providerId);

    if (auto s = scope(scopeKey(*provider), false)) {
        QMutexLocker locker(&s->mutex);
        for (const ProviderEndpoint& ep : provider->endpoints)
            s->markers.remove({ep.apiKey, ep.url});
    }

    if (wasCooling)
        LOG_INFO(QStringLiteral("Cooldown: cleared for provider %1").arg(providerId));
    return {};
}

bool CooldownManager::hasFailureMarker(const Provider& provider, const QString& apiKey,
                                       const QString& url) const
{
    auto s = scope(scopeKey(provider), false);
    if (!s)
        return false;
    QMutexLocker locker(&s->mutex);
    return s->markers.contains({apiKey, url});
}
