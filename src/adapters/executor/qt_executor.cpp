#include "qt_executor.h"
#include "core/log_manager.h"
#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkReply>
#include <QTimer>
#include <QUrl>

namespace {

constexpr int kCancelPollMs = 100;

}

QtExecutor::QtExecutor(ConnectionPool& pool)
    : m_pool(pool)
{
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const
{
    QNetworkRequest req{QUrl{request.url}};
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!request.body.isEmpty() && !req.hasRawHeader("content-type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    return req;
}

QNetworkReply* QtExecutor::send(QNetworkAccessManager* nam, const QNetworkRequest& req,
                                const ProviderRequest& request)
{
    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return nam->post(req, request.body);
    if (method == "GET")
        return nam->get(req);
    if (method == "PUT")
        return nam->put(req, request.body);
    if (method == "DELETE")
        return nam->deleteResource(req);
    return nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

QMap<QString, QString> QtExecutor::collectHeaders(const QNetworkReply* reply)
{
    QMap<QString, QString> headers;
    for (const QByteArray& name : reply->rawHeaderList())
        headers[QString::fromLatin1(name).toLower()] = QString::fromUtf8(reply->rawHeader(name));
    return headers;
}

Result<ProviderResponse> QtExecutor::execute(const ProviderRequest& request, const ExecOptions& options)
{
    if (isCancelled(options.cancel))
        return std::unexpected(DomainFailure::cancelled());

    QNetworkAccessManager* nam = m_pool.acquire();
    QNetworkReply* reply = send(nam, buildQtRequest(request), request);

    QElapsedTimer elapsed;
    elapsed.start();

    bool headersSeen = false;
    bool requestSent = false;
    bool streaming = false;
    bool connectTimedOut = false;
    bool totalTimedOut = false;
    bool idleTimedOut = false;
    bool cancelled = false;

    ProviderResponse resp;
    QEventLoop loop;

    QTimer connectTimer;
    connectTimer.setSingleShot(true);
    QObject::connect(&connectTimer, &QTimer::timeout, &loop, [&]() {
        if (!requestSent && !headersSeen) {
            connectTimedOut = true;
            reply->abort();
        }
    });

    QTimer totalTimer;
    totalTimer.setSingleShot(true);
    QObject::connect(&totalTimer, &QTimer::timeout, &loop, [&]() {
        totalTimedOut = true;
        reply->abort();
    });

    QTimer idleTimer;
    idleTimer.setSingleShot(true);
    QObject::connect(&idleTimer, &QTimer::timeout, &loop, [&]() {
        idleTimedOut = true;
        reply->abort();
    });

    QTimer cancelTimer;
    QObject::connect(&cancelTimer, &QTimer::timeout, &loop, [&]() {
        if (isCancelled(options.cancel)) {
            cancelled = true;
            reply->abort();
        }
    });

    QObject::connect(reply, &QNetworkReply::requestSent, &loop, [&]() {
        requestSent = true;
        connectTimer.stop();
    });

    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, [&]() {
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (headersSeen || !status.isValid())
            return;
        headersSeen = true;
        connectTimer.stop();
        resp.statusCode = status.toInt();
        resp.headers = collectHeaders(reply);
        resp.headerLatencyMs = elapsed.elapsed();

        const bool eventStream = resp.header(QStringLiteral("content-type"))
                                     .contains(QStringLiteral("text/event-stream"), Qt::CaseInsensitive);
        if (options.sink && resp.isSuccess() && eventStream) {
            // From here on the response belongs to the caller; only idleness ends it.
            streaming = true;
            totalTimer.stop();
            if (options.streamIdleTimeoutMs > 0)
                idleTimer.start(options.streamIdleTimeoutMs);
            options.sink->beginStream(resp.statusCode, resp.headers);
        }
    });

    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        if (!streaming)
            return;
        if (options.streamIdleTimeoutMs > 0)
            idleTimer.start(options.streamIdleTimeoutMs);
        options.sink->writeChunk(reply->readAll());
    });

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    if (options.connectionTimeoutMs > 0)
        connectTimer.start(options.connectionTimeoutMs);
    if (options.requestTimeoutMs > 0)
        totalTimer.start(options.requestTimeoutMs);
    if (options.cancel)
        cancelTimer.start(kCancelPollMs);

    if (!reply->isFinished())
        loop.exec();

    connectTimer.stop();
    totalTimer.stop();
    idleTimer.stop();
    cancelTimer.stop();

    const auto cleanup = [&]() {
        reply->disconnect();
        delete reply;
        m_pool.release(nam);
    };

    if (streaming) {
        const QByteArray rest = reply->readAll();
        if (!rest.isEmpty())
            options.sink->writeChunk(rest);
        if (cancelled || idleTimedOut || reply->error() != QNetworkReply::NoError) {
            LOG_WARNING(QStringLiteral("QtExecutor: stream from %1 ended early: %2")
                            .arg(request.url,
                                 idleTimedOut ? QStringLiteral("idle timeout") : reply->errorString()));
        }
        options.sink->endStream();
        resp.streamed = true;
        cleanup();
        return resp;
    }

    if (cancelled) {
        cleanup();
        return std::unexpected(DomainFailure::cancelled());
    }
    if (connectTimedOut) {
        cleanup();
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("could not reach %1 within %2 ms").arg(request.url).arg(options.connectionTimeoutMs)));
    }
    if (totalTimedOut) {
        cleanup();
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("%1 did not complete within %2 ms").arg(request.url).arg(options.requestTimeoutMs)));
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        const DomainFailure failure = reply->error() == QNetworkReply::TimeoutError
            ? DomainFailure::timeout(reply->errorString())
            : DomainFailure::networkFailure(reply->errorString());
        cleanup();
        return std::unexpected(failure);
    }

    resp.statusCode = status.toInt();
    resp.headers = collectHeaders(reply);
    resp.body = reply->readAll();
    if (resp.headerLatencyMs < 0)
        resp.headerLatencyMs = elapsed.elapsed();
    cleanup();
    return resp;
}
