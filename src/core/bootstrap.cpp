#include "bootstrap.h"
#include "log_manager.h"
#include "config/config_store.h"

Bootstrap::Bootstrap(ConfigStore& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    const ProxyConfig cfg = m_config.proxyConfig();

    m_breakers = std::make_unique<BreakerBoard>(m_clock, cfg.breaker);
    m_cooldowns = std::make_unique<CooldownManager>(m_registry, *m_breakers, m_clock, cfg.cooldown);
    m_selector = std::make_unique<ProviderSelector>(m_registry, *m_breakers, m_clock);
    m_waf = std::make_unique<WafRegistry>(m_clock);
    m_waf->registerDefaults();
    m_executor = std::make_unique<QtExecutor>(m_connectionPool);
    m_sender = std::make_unique<UpstreamSender>(*m_executor, *m_waf);
    m_probes = std::make_unique<ProbeEngine>(*m_sender, m_clock, cfg.probe);
    m_dispatcher = std::make_unique<RequestDispatcher>(m_registry, *m_breakers, *m_cooldowns, *m_selector,
                                                       *m_probes, *m_sender, m_router, m_clock);
    m_admin = std::make_unique<AdminApi>(*m_cooldowns, m_registry, *m_breakers);
    m_proxy = new ProxyServer(*m_dispatcher, m_admin.get(), this);

    m_registry.setRepository(&m_config);

    connect(m_proxy, &ProxyServer::statusChanged, this, &Bootstrap::proxyStatusChanged);
    connect(&m_config, &ConfigStore::configChanged, this, &Bootstrap::applyOptions);
    connect(&m_refreshTimer, &QTimer::timeout, this, &Bootstrap::refreshRegistry);
    connect(&m_flushTimer, &QTimer::timeout, this, &Bootstrap::flushRuntimeState);
}

Bootstrap::~Bootstrap()
{
    stopAll();
    // The listener refers to the dispatcher, which is destroyed before children are.
    delete m_proxy;
    m_proxy = nullptr;
}

DispatchOptions Bootstrap::dispatchOptionsFrom(const ProxyConfig& config)
{
    DispatchOptions options;
    options.maxAttempts = config.runtime.maxAttempts;
    options.maxRetries = config.runtime.maxRetries;
    options.connectionTimeoutMs = config.runtime.connectionTimeout;
    options.requestTimeoutMs = config.runtime.requestTimeout;
    options.streamIdleTimeoutMs = config.runtime.streamIdleTimeout;
    options.probeEnabled = config.probe.enabled;
    for (AppFamily family : app_family::all()) {
        const FamilyOptions f = config.family(family);
        options.rules.insert(family, RewriteRules{f.customHeaders, f.systemPrompt});
    }
    return options;
}

void Bootstrap::applyOptions()
{
    const ProxyConfig cfg = m_config.proxyConfig();
    m_breakers->setOptions(cfg.breaker);
    m_cooldowns->setOptions(cfg.cooldown);
    m_probes->setOptions(cfg.probe);
    m_dispatcher->setOptions(dispatchOptionsFrom(cfg));
    LogManager::instance().setMinimumLevel(
        (cfg.runtime.debugMode || m_debugOverride) ? LogManager::Debug : LogManager::Info);

    const int interval = cfg.runtime.registryRefreshInterval;
    if (m_started && m_refreshTimer.interval() != interval) {
        m_refreshTimer.start(interval);
        m_flushTimer.start(interval);
    }
}

bool Bootstrap::startAll()
{
    if (m_started)
        return true;

    LOG_INFO(QStringLiteral("========== starting switchboard =========="));
    applyOptions();

    const auto loaded = m_registry.refresh();
    if (!loaded) {
        LOG_ERROR(QStringLiteral("Bootstrap: cannot load providers: %1").arg(loaded.error().message));
        return false;
    }
    if (m_registry.size() == 0)
        LOG_WARNING(QStringLiteral("Bootstrap: no usable provider configured, every request will be answered with 503"));

    const ProxyConfig cfg = m_config.proxyConfig();
    for (AppFamily family : app_family::all()) {
        const QString active = cfg.family(family).activeProvider;
        if (!active.isEmpty())
            m_registry.setActiveProvider(family, active);
    }

    RuntimeOptions runtime = cfg.runtime;
    if (m_portOverride)
        runtime.proxyPort = *m_portOverride;
    if (!m_proxy->start(runtime))
        return false;

    m_refreshTimer.start(runtime.registryRefreshInterval);
    m_flushTimer.start(runtime.registryRefreshInterval);
    m_started = true;
    LOG_INFO(QStringLiteral("Bootstrap: %1 provider(s) loaded, proxy on port %2")
                 .arg(m_registry.size())
                 .arg(m_proxy->serverPort()));
    return true;
}

void Bootstrap::stopAll()
{
    if (!m_started)
        return;
    m_started = false;

    m_refreshTimer.stop();
    m_flushTimer.stop();
    m_proxy->stop();
    flushRuntimeState();
    m_connectionPool.clear();
    LOG_INFO(QStringLiteral("========== switchboard stopped =========="));
}

bool Bootstrap::isProxyRunning() const
{
    return m_proxy && m_proxy->isRunning();
}

quint16 Bootstrap::proxyPort() const
{
    return m_proxy ? m_proxy->serverPort() : 0;
}

void Bootstrap::refreshRegistry()
{
    const auto refreshed = m_registry.refresh();
    if (!refreshed)
        LOG_WARNING(QStringLiteral("Bootstrap: provider refresh failed, keeping the previous list: %1")
                        .arg(refreshed.error().message));
}

void Bootstrap::flushRuntimeState()
{
    const auto flushed = m_registry.flush();
    if (!flushed) {
        LOG_WARNING(QStringLiteral("Bootstrap: runtime state not persisted: %1").arg(flushed.error().message));
        return;
    }

    QMap<AppFamily, QString> active;
    for (AppFamily family : app_family::all())
        active.insert(family, m_registry.activeProvider(family));
    m_config.setActiveProviders(active);
}
