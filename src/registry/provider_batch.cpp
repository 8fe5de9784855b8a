#include "provider_batch.h"
#include <QRegularExpression>
#include <QSet>

namespace provider_batch {

QString slugify(const QString& group)
{
    static const QRegularExpression nonSlug(QStringLiteral("[^a-z0-9]+"));
    QString slug = group.trimmed().toLower();
    slug.replace(nonSlug, QStringLiteral("-"));
    while (slug.startsWith(QLatin1Char('-')))
        slug.remove(0, 1);
    while (slug.endsWith(QLatin1Char('-')))
        slug.chop(1);
    return slug.isEmpty() ? QStringLiteral("provider") : slug;
}

Result<QList<Provider>> expand(const ProviderBatch& batch, const QList<Provider>& existing)
{
    const QString group = batch.group.trimmed();
    if (group.isEmpty())
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("batch_group"), QStringLiteral("batch needs a group name")));

    QStringList urls;
    for (const QString& u : batch.urls) {
        const QString trimmed = u.trimmed();
        if (!trimmed.isEmpty() && !urls.contains(trimmed))
            urls.append(trimmed);
    }
    QStringList keys;
    for (const QString& k : batch.keys) {
        const QString trimmed = k.trimmed();
        if (!trimmed.isEmpty() && !keys.contains(trimmed))
            keys.append(trimmed);
    }
    if (urls.isEmpty() || keys.isEmpty())
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("batch_empty"), QStringLiteral("batch needs at least one url and one key")));

    const QString slug = slugify(group);
    const QRegularExpression idPattern(
        QStringLiteral("^%1-(\\d+)$").arg(QRegularExpression::escape(slug)));

    int nextNumber = 1;
    int nextSortIndex = 0;
    bool groupSeen = false;
    QSet<QString> takenIds;
    for (const Provider& p : existing) {
        takenIds.insert(p.id);
        const auto m = idPattern.match(p.id);
        if (m.hasMatch())
            nextNumber = qMax(nextNumber, m.captured(1).toInt() + 1);
        if (p.family == batch.family && p.effectiveGroup() == group) {
            nextSortIndex = groupSeen ? qMax(nextSortIndex, p.sortIndex + 1) : p.sortIndex + 1;
            groupSeen = true;
        }
    }

    QList<Provider> created;
    for (const QString& url : urls) {
        for (const QString& key : keys) {
            QString id;
            do {
                id = QStringLiteral("%1-%2").arg(slug).arg(nextNumber);
                ++nextNumber;
            } while (takenIds.contains(id));
            takenIds.insert(id);

            Provider p;
            p.id = id;
            p.name = QStringLiteral("%1-%2").arg(group).arg(nextNumber - 1);
            p.group = group;
            p.family = batch.family;
            p.rotationTier = batch.rotationTier;
            p.groupPriority = batch.groupPriority;
            p.sortIndex = nextSortIndex++;
            p.cooldownDurationSecs = batch.cooldownDurationSecs > 0
                ? batch.cooldownDurationSecs : kDefaultCooldownSeconds;
            p.customHeaders = batch.customHeaders;

            ProviderEndpoint ep;
            ep.url = url;
            ep.apiKey = key;
            p.endpoints.append(ep);
            created.append(p);
        }
    }
    return created;
}

}
