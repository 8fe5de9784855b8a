#include "outcome_classifier.h"
#include <QJsonDocument>
#include <QJsonObject>

namespace outcome_classifier {

bool looksOverloaded(const QByteArray& body)
{
    const QByteArray lower = body.left(4096).toLower();
    return lower.contains("rate limit")
        || lower.contains("too many requests")
        || lower.contains("temporarily unavailable");
}

QString extractErrorMessage(const QByteArray& body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject root = doc.object();
        const QJsonValue error = root.value(QStringLiteral("error"));
        if (error.isObject()) {
            const QString msg = error.toObject().value(QStringLiteral("message")).toString();
            if (!msg.isEmpty())
                return msg;
        } else if (error.isString() && !error.toString().isEmpty()) {
            return error.toString();
        }
        const QString msg = root.value(QStringLiteral("message")).toString();
        if (!msg.isEmpty())
            return msg;
    }
    return QString::fromUtf8(body.left(200)).simplified();
}

std::optional<DomainFailure> classify(const ProviderResponse& response)
{
    const int status = response.statusCode;
    if (response.isSuccess())
        return std::nullopt;

    const QString detail = QStringLiteral("HTTP %1: %2")
                               .arg(status)
                               .arg(extractErrorMessage(response.body));

    if (status == 401 || status == 403)
        return DomainFailure::authFailure(status, detail);
    if (status == 429 || looksOverloaded(response.body)) {
        DomainFailure failure = DomainFailure::rateLimited(detail);
        failure.upstreamStatus = status;
        return failure;
    }
    if (status == 408 || status >= 500 || status <= 0) {
        DomainFailure failure = DomainFailure::networkFailure(detail);
        failure.upstreamStatus = status;
        return failure;
    }
    return DomainFailure::upstreamRejected(status, detail);
}

}
