#pragma once
#include "failure.h"
#include <expected>
#include <atomic>
#include <memory>
#include <QByteArray>
#include <QMap>
#include <QString>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

// Shared between the listener (sets it on disconnect) and the worker running
// the dispatch loop (polls it).
using CancelToken = std::shared_ptr<std::atomic_bool>;

inline CancelToken makeCancelToken()
{
    return std::make_shared<std::atomic_bool>(false);
}

inline bool isCancelled(const CancelToken& token)
{
    return token && token->load();
}

// Request as received on the loopback listener. Header names are lower-case.
struct InboundRequest {
    QString method;
    QString path;      // includes the query string
    QMap<QString, QString> headers;
    QByteArray body;
};

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;   // lower-case names
    QByteArray body;
    bool streamed = false;            // body already forwarded to the sink
    qint64 headerLatencyMs = -1;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
    QString header(const QString& name) const { return headers.value(name.toLower()); }
};

// Receives a streaming 2xx upstream body as it arrives.
class IResponseSink {
public:
    virtual ~IResponseSink() = default;
    virtual void beginStream(int statusCode, const QMap<QString, QString>& headers) = 0;
    virtual void writeChunk(const QByteArray& data) = 0;
    virtual void endStream() = 0;
};

struct ExecOptions {
    int connectionTimeoutMs = 30000;
    int requestTimeoutMs = 600000;
    int streamIdleTimeoutMs = 60000;
    CancelToken cancel;
    IResponseSink* sink = nullptr;
};

// Transport only: HTTP error statuses come back as a ProviderResponse,
// connection problems, timeouts and cancellation as a DomainFailure.
class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Result<ProviderResponse> execute(const ProviderRequest& request,
                                             const ExecOptions& options) = 0;
};
