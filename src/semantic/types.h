#pragma once
#include <QtGlobal>
#include <QString>
#include <QList>
#include <optional>

enum class AppFamily : quint8 {
    Claude,   // /claude/*, /v1/messages
    Codex,    // /codex/*, /v1/chat/completions
    Gemini    // /gemini/*, /v1beta/*
};

enum class ErrorKind : quint8 {
    NetworkFailure,    // 502  connection, timeout, 5xx (failover)
    AuthFailure,       // 401  rejected credential (failover)
    WafChallenge,      // 502  only seen inside Send
    RateLimited,       // 429  (failover)
    UpstreamRejected,  // 502  other non-2xx upstream reply (failover)
    Exhausted,         // 503
    ConfigInvalid,     // 500
    InvalidInput,      // 400
    Cancelled,         // caller went away
    Internal           // 500
};

namespace app_family {

QString name(AppFamily family);
std::optional<AppFamily> fromName(const QString& name);
const QList<AppFamily>& all();

}

QString errorKindName(ErrorKind kind);

