#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;
    int         upstreamStatus = 0;

    int httpStatus() const;
    QJsonObject toJson() const;

    // True for the kinds the dispatcher records against a candidate.
    bool countsAgainstCandidate() const;

    static DomainFailure networkFailure(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure authFailure(int status, const QString& msg);
    static DomainFailure wafChallenge(const QString& vendor, const QString& msg);
    static DomainFailure rateLimited(const QString& msg);
    static DomainFailure upstreamRejected(int status, const QString& msg);
    static DomainFailure exhausted(const QString& msg);
    static DomainFailure configInvalid(const QString& code, const QString& msg);
    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure cancelled();
    static DomainFailure internal(const QString& msg);
};
