#include "upstream_sender.h"
#include "outcome_classifier.h"
#include "core/log_manager.h"
#include <QUrl>

UpstreamSender::UpstreamSender(IExecutor& executor, WafRegistry& waf)
    : m_executor(executor)
    , m_waf(waf)
{
}

ProviderRequest UpstreamSender::withCookie(const ProviderRequest& request, const QString& pair) const
{
    ProviderRequest copy = request;
    QString existingKey = QStringLiteral("cookie");
    for (auto it = copy.headers.cbegin(); it != copy.headers.cend(); ++it) {
        if (it.key().compare(QStringLiteral("cookie"), Qt::CaseInsensitive) == 0) {
            existingKey = it.key();
            break;
        }
    }
    copy.headers[existingKey] = WafRegistry::mergeCookieHeader(copy.headers.value(existingKey), pair);
    return copy;
}

SendOutcome UpstreamSender::send(const ProviderRequest& request, const ExecOptions& options) const
{
    SendOutcome outcome;
    const QString host = QUrl(request.url).host();

    ProviderRequest outgoing = request;
    const QString cached = m_waf.cookieFor(host);
    if (!cached.isEmpty())
        outgoing = withCookie(request, cached);

    auto result = m_executor.execute(outgoing, options);
    if (!result) {
        outcome.failure = result.error();
        return outcome;
    }

    if (!result->streamed) {
        if (const IWafSolver* solver = m_waf.match(*result)) {
            auto solution = solver->solve(*result);
            if (!solution) {
                LOG_WARNING(QStringLiteral("UpstreamSender: %1 challenge from %2 could not be solved: %3")
                                .arg(solver->vendor(), host, solution.error().message));
                outcome.response = *result;
                outcome.failure = DomainFailure::networkFailure(
                    QStringLiteral("unsolved %1 challenge").arg(solver->vendor()));
                return outcome;
            }

            LOG_INFO(QStringLiteral("UpstreamSender: answering %1 challenge from %2")
                         .arg(solver->vendor(), host));
            m_waf.rememberCookie(host, *solution);
            outcome.wafRetried = true;
            result = m_executor.execute(withCookie(request, solution->cookiePair()), options);
            if (!result) {
                outcome.failure = result.error();
                return outcome;
            }
            if (!result->streamed && m_waf.match(*result)) {
                m_waf.forgetCookie(host);
                outcome.response = *result;
                outcome.failure = DomainFailure::networkFailure(
                    QStringLiteral("%1 challenge persisted after bypass").arg(solver->vendor()));
                return outcome;
            }
        }
    }

    outcome.response = *result;
    if (!result->streamed)
        outcome.failure = outcome_classifier::classify(*result);
    return outcome;
}
