#include "provider.h"
#include <QUrl>

bool ProviderEndpoint::isUsable() const
{
    if (apiKey.trimmed().isEmpty())
        return false;
    const QUrl parsed(url);
    return parsed.isValid()
        && (parsed.scheme() == QStringLiteral("http") || parsed.scheme() == QStringLiteral("https"))
        && !parsed.host().isEmpty();
}

qint64 Provider::latestCooldownUntil() const
{
    qint64 latest = cooldownUntil;
    for (const ProviderEndpoint& ep : endpoints)
        latest = qMax(latest, ep.cooldownUntil);
    return latest;
}

int Provider::endpointIndex(const QString& url, const QString& apiKey) const
{
    for (int i = 0; i < endpoints.size(); ++i) {
        if (endpoints[i].url == url && endpoints[i].apiKey == apiKey)
            return i;
    }
    return -1;
}

QString CandidateId::toString() const
{
    return QStringLiteral("%1@%2[%3]").arg(providerId, url, maskApiKey(apiKey));
}

size_t qHash(const CandidateId& id, size_t seed) noexcept
{
    return qHashMulti(seed, id.providerId, id.url, id.apiKey);
}

QString maskApiKey(const QString& key)
{
    if (key.size() <= 8)
        return QStringLiteral("****");
    return key.left(4) + QStringLiteral("...") + key.right(4);
}
