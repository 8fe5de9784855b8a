#pragma once
#include "clock.h"
#include "adapters/executor/qt_executor.h"
#include "config/config_types.h"
#include "dispatch/probe_engine.h"
#include "dispatch/request_dispatcher.h"
#include "dispatch/upstream_sender.h"
#include "proxy/admin_api.h"
#include "proxy/connection_pool.h"
#include "proxy/proxy_server.h"
#include "proxy/transparent_router.h"
#include "registry/provider_registry.h"
#include "routing/circuit_breaker.h"
#include "routing/cooldown_manager.h"
#include "routing/provider_selector.h"
#include "waf/waf_registry.h"
#include <QObject>
#include <QTimer>
#include <memory>
#include <optional>

class ConfigStore;

// Owns the dispatch components and the listener, keeps the registry in step
// with the configuration file and writes runtime state back to it.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(ConfigStore& config, QObject* parent = nullptr);
    ~Bootstrap() override;

    void setPortOverride(int port) { m_portOverride = port; }
    void setDebugOverride(bool debug) { m_debugOverride = debug; }

    bool startAll();
    void stopAll();

    bool isProxyRunning() const;
    quint16 proxyPort() const;

    static DispatchOptions dispatchOptionsFrom(const ProxyConfig& config);

signals:
    void proxyStatusChanged(bool running);

private slots:
    void applyOptions();
    void refreshRegistry();
    void flushRuntimeState();

private:
    ConfigStore& m_config;
    SystemClock m_clock;
    ProviderRegistry m_registry;
    std::unique_ptr<BreakerBoard> m_breakers;
    std::unique_ptr<CooldownManager> m_cooldowns;
    std::unique_ptr<ProviderSelector> m_selector;
    std::unique_ptr<WafRegistry> m_waf;
    ConnectionPool m_connectionPool;
    std::unique_ptr<QtExecutor> m_executor;
    std::unique_ptr<UpstreamSender> m_sender;
    std::unique_ptr<ProbeEngine> m_probes;
    TransparentRouter m_router;
    std::unique_ptr<RequestDispatcher> m_dispatcher;
    std::unique_ptr<AdminApi> m_admin;
    ProxyServer* m_proxy = nullptr;

    QTimer m_refreshTimer;
    QTimer m_flushTimer;
    std::optional<int> m_portOverride;
    bool m_debugOverride = false;
    bool m_started = false;
};
