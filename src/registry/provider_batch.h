#pragma once
#include "provider.h"
#include "semantic/ports.h"
#include <QStringList>

struct ProviderBatch {
    AppFamily family = AppFamily::Claude;
    QString group;
    QStringList urls;
    QStringList keys;
    int rotationTier = 0;
    int groupPriority = 0;
    qint64 cooldownDurationSecs = kDefaultCooldownSeconds;
    QMap<QString, QString> customHeaders;
};

namespace provider_batch {

// Expands urls x keys into one provider per pair, numbering ids and
// sort indexes after the providers that already exist in the group.
Result<QList<Provider>> expand(const ProviderBatch& batch, const QList<Provider>& existing);

QString slugify(const QString& group);

}
