#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:
        return code == QStringLiteral("not_found") ? 404 : 400;
    case ErrorKind::AuthFailure:       return 401;
    case ErrorKind::RateLimited:       return 429;
    case ErrorKind::NetworkFailure:
    case ErrorKind::WafChallenge:
    case ErrorKind::UpstreamRejected:  return 502;
    case ErrorKind::Exhausted:         return 503;
    case ErrorKind::Cancelled:         return 499;
    case ErrorKind::ConfigInvalid:
    case ErrorKind::Internal:
    default:                           return 500;
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["type"] = errorKindName(kind);
    if (upstreamStatus > 0)
        err["upstream_status"] = upstreamStatus;
    QJsonObject root;
    root["error"] = err;
    return root;
}

bool DomainFailure::countsAgainstCandidate() const {
    switch (kind) {
    case ErrorKind::NetworkFailure:
    case ErrorKind::AuthFailure:
    case ErrorKind::WafChallenge:
    case ErrorKind::RateLimited:
    case ErrorKind::UpstreamRejected:
        return true;
    default:
        return false;
    }
}

DomainFailure DomainFailure::networkFailure(const QString& msg) {
    return {ErrorKind::NetworkFailure, "network_failure", msg, true, true, 0};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::NetworkFailure, "timeout", msg, true, true, 0};
}

DomainFailure DomainFailure::authFailure(int status, const QString& msg) {
    return {ErrorKind::AuthFailure, "auth_failure", msg, true, false, status};
}

DomainFailure DomainFailure::wafChallenge(const QString& vendor, const QString& msg) {
    return {ErrorKind::WafChallenge, vendor, msg, true, true, 0};
}

DomainFailure DomainFailure::rateLimited(const QString& msg) {
    return {ErrorKind::RateLimited, "rate_limited", msg, true, true, 429};
}

DomainFailure DomainFailure::upstreamRejected(int status, const QString& msg) {
    return {ErrorKind::UpstreamRejected, "upstream_rejected", msg, true, false, status};
}

DomainFailure DomainFailure::exhausted(const QString& msg) {
    return {ErrorKind::Exhausted, "exhausted", msg, false, true, 0};
}

DomainFailure DomainFailure::configInvalid(const QString& code, const QString& msg) {
    return {ErrorKind::ConfigInvalid, code, msg, false, false, 0};
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, false, 0};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::InvalidInput, "not_found", msg, false, false, 0};
}

DomainFailure DomainFailure::cancelled() {
    return {ErrorKind::Cancelled, "cancelled", "client disconnected", false, false, 0};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false, 0};
}
