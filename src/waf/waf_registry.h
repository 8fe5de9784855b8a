#pragma once
#include "waf_solver.h"
#include "core/clock.h"
#include <QHash>
#include <QMutex>
#include <memory>
#include <vector>

// Vendors are tried in registration order; the dispatch loop only ever talks
// to this registry.
class WafRegistry {
public:
    explicit WafRegistry(const Clock& clock);

    void registerSolver(std::unique_ptr<IWafSolver> solver);
    void registerDefaults();
    int solverCount() const { return static_cast<int>(m_solvers.size()); }

    const IWafSolver* match(const ProviderResponse& response) const;

    void rememberCookie(const QString& host, const WafSolution& solution);
    QString cookieFor(const QString& host) const;
    void forgetCookie(const QString& host);

    static QString mergeCookieHeader(const QString& existing, const QString& pair);

private:
    struct CachedCookie {
        QString pair;
        qint64 expiresAt = 0;
    };

    const Clock& m_clock;
    std::vector<std::unique_ptr<IWafSolver>> m_solvers;

    mutable QMutex m_cookieMutex;
    QHash<QString, CachedCookie> m_cookies;
};
