#pragma once
#include "config_types.h"
#include "registry/provider_batch.h"
#include "registry/provider_repository.h"
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <optional>

// One JSON document holding the proxy options and the provider list. Keys the
// store does not know about are carried through a save untouched.
class ConfigStore : public QObject, public IProviderRepository {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // A missing file is not an error: defaults are used and written on save().
    bool load(const QString& path);
    bool reload();
    bool save();

    QString filePath() const { return m_filePath; }
    static QString defaultPath();

    ProxyConfig proxyConfig() const { return m_config; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }
    void setRuntimeOptions(const RuntimeOptions& options);

    QList<Provider> providers();
    void setActiveProviders(const QMap<AppFamily, QString>& active);
    VoidResult clearProviderCooldown(const QString& providerId);
    VoidResult removeProvider(const QString& providerId);
    Result<QList<Provider>> addProviderBatch(const ProviderBatch& batch);

    Result<QList<Provider>> loadProviders() override;
    VoidResult storeRuntimeState(const QList<ProviderRuntimeState>& states) override;
    VoidResult addProviders(const QList<Provider>& providers) override;
    VoidResult setProviderCooldown(const QString& providerId, qint64 untilMs) override;

    static QString encodeApiKey(const QString& plain);
    static QString decodeApiKey(const QString& encoded);

    // position is used as sort_index when the entry has none.
    static std::optional<Provider> providerFromJson(const QJsonObject& obj, int position);
    static QJsonObject providerToJson(const Provider& provider);

signals:
    void configChanged();

private:
    // True when the parsed options differ from the current ones.
    bool parseOptions(const QJsonObject& root);
    QJsonObject optionsToJson(QJsonObject root) const;
    bool writeProviders(const QJsonArray& providers);
    VoidResult requireFreshDocument();

    QString m_filePath;
    QJsonObject m_root;
    ProxyConfig m_config;
    QSet<QString> m_reportedInvalid;
};
