#include "waf_registry.h"
#include "acw_sc_v2_solver.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <QStringList>

namespace {

constexpr qint64 kCookieLifetimeMs = 30 * 60 * 1000;

}

WafRegistry::WafRegistry(const Clock& clock)
    : m_clock(clock)
{
}

void WafRegistry::registerSolver(std::unique_ptr<IWafSolver> solver)
{
    if (!solver)
        return;
    LOG_DEBUG(QStringLiteral("WafRegistry: registered solver %1").arg(solver->vendor()));
    m_solvers.push_back(std::move(solver));
}

void WafRegistry::registerDefaults()
{
    registerSolver(std::make_unique<AcwScV2Solver>());
}

const IWafSolver* WafRegistry::match(const ProviderResponse& response) const
{
    for (const auto& solver : m_solvers) {
        if (solver->matches(response))
            return solver.get();
    }
    return nullptr;
}

void WafRegistry::rememberCookie(const QString& host, const WafSolution& solution)
{
    QMutexLocker locker(&m_cookieMutex);
    m_cookies.insert(host.toLower(), {solution.cookiePair(), m_clock.nowMs() + kCookieLifetimeMs});
}

QString WafRegistry::cookieFor(const QString& host) const
{
    QMutexLocker locker(&m_cookieMutex);
    const auto it = m_cookies.constFind(host.toLower());
    if (it == m_cookies.cend() || it->expiresAt <= m_clock.nowMs())
        return QString();
    return it->pair;
}

void WafRegistry::forgetCookie(const QString& host)
{
    QMutexLocker locker(&m_cookieMutex);
    m_cookies.remove(host.toLower());
}

QString WafRegistry::mergeCookieHeader(const QString& existing, const QString& pair)
{
    if (existing.trimmed().isEmpty())
        return pair;

    const QString name = pair.section(QLatin1Char('='), 0, 0);
    QStringList parts;
    for (const QString& part : existing.split(QLatin1Char(';'), Qt::SkipEmptyParts)) {
        const QString trimmed = part.trimmed();
        if (trimmed.section(QLatin1Char('='), 0, 0) != name)
            parts.append(trimmed);
    }
    parts.append(pair);
    return parts.join(QStringLiteral("; "));
}
