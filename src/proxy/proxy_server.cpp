#include "proxy_server.h"
#include "sse_writer.h"
#include "core/log_manager.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>

namespace {

constexpr int kMaxRequestBytes = 64 * 1024 * 1024;

// Forwards a streaming upstream body from a worker thread to the socket's
// thread. Calls are queued, so they keep their order.
class SocketResponseSink : public IResponseSink {
public:
    SocketResponseSink(QObject* context, QTcpSocket* socket)
        : m_context(context)
        , m_socket(socket)
    {
    }

    void beginStream(int statusCode, const QMap<QString, QString>& headers) override
    {
        QPointer<QTcpSocket> socket = m_socket;
        QMetaObject::invokeMethod(m_context, [socket, statusCode, headers]() {
            if (socket)
                SseWriter::writeStreamHeader(socket, statusCode, headers);
        }, Qt::QueuedConnection);
    }

    void writeChunk(const QByteArray& data) override
    {
        QPointer<QTcpSocket> socket = m_socket;
        QMetaObject::invokeMethod(m_context, [socket, data]() {
            if (socket)
                SseWriter::sendChunk(socket, data);
        }, Qt::QueuedConnection);
    }

    void endStream() override
    {
        QPointer<QTcpSocket> socket = m_socket;
        QMetaObject::invokeMethod(m_context, [socket]() {
            if (socket)
                SseWriter::sendTerminator(socket);
        }, Qt::QueuedConnection);
    }

private:
    QObject* m_context;
    QPointer<QTcpSocket> m_socket;
};

QString statusText(int status)
{
    static const QMap<int, QString> texts = {
        {200, QStringLiteral("OK")},
        {201, QStringLiteral("Created")},
        {204, QStringLiteral("No Content")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {405, QStringLiteral("Method Not Allowed")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {499, QStringLiteral("Client Closed Request")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };
    return texts.value(status, QStringLiteral("Unknown"));
}

}

ProxyServer::ProxyServer(RequestDispatcher& dispatcher, AdminApi* admin, QObject* parent)
    : QObject(parent)
    , m_dispatcher(dispatcher)
    , m_admin(admin)
{
    // Worker threads keep their network managers, so they must not expire.
    m_workers.setExpiryTimeout(-1);
}

ProxyServer::~ProxyServer()
{
    stop();
}

bool ProxyServer::isPortInUse(const QHostAddress& address, int port)
{
    QTcpServer test;
    bool available = test.listen(address, static_cast<quint16>(port));
    if (available) test.close();
    return !available;
}

bool ProxyServer::start(const RuntimeOptions& options)
{
    if (m_server)
        stop();

    const QHostAddress address(options.listenAddress);
    if (address.isNull() || !address.isLoopback()) {
        LOG_ERROR(QStringLiteral("ProxyServer: refusing to listen on non-loopback address '%1'")
                      .arg(options.listenAddress));
        return false;
    }

    const quint16 port = static_cast<quint16>(options.proxyPort);
    if (port != 0 && isPortInUse(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: port %1 is already in use").arg(port));
        return false;
    }

    m_workers.setMaxThreadCount(qMax(1, options.workerThreads));

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on %1:%2 - %3")
                      .arg(options.listenAddress)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on %1:%2 (%3 workers)")
                 .arg(options.listenAddress)
                 .arg(m_server->serverPort())
                 .arg(m_workers.maxThreadCount()));
    emit statusChanged(true);
    return true;
}

void ProxyServer::stop()
{
    if (!m_server)
        return;

    m_server->close();

    // In-flight dispatches see the cancellation on their next poll.
    for (auto it = m_connections.begin(); it != m_connections.end(); ++it) {
        if (it->cancel)
            it->cancel->store(true);
    }
    m_workers.waitForDone();

    const QList<QTcpSocket*> sockets = m_connections.keys();
    m_connections.clear();
    for (QTcpSocket* socket : sockets) {
        socket->disconnect(this);
        socket->disconnectFromHost();
        socket->deleteLater();
    }

    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: proxy server stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket)
            continue;

        m_connections.insert(socket, Connection{});
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !m_connections.contains(socket))
        return;

    m_connections[socket].pending += socket->readAll();
    processBuffer(socket);
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket)
        return;

    const auto it = m_connections.find(socket);
    if (it != m_connections.end()) {
        if (it->cancel)
            it->cancel->store(true);
        m_connections.erase(it);
    }
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

void ProxyServer::processBuffer(QTcpSocket* socket)
{
    while (m_connections.contains(socket)) {
        Connection& conn = m_connections[socket];
        // One request at a time per connection; pipelined data waits.
        if (conn.busy)
            return;

        QByteArray& buffer = conn.pending;
        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (buffer.size() > kMaxRequestBytes) {
                sendHttpResponse(socket, 413, QJsonDocument(DomainFailure::invalidInput(
                    QStringLiteral("request_too_large"), QStringLiteral("request header too large"))
                    .toJson()).toJson(QJsonDocument::Compact));
                buffer.clear();
                socket->disconnectFromHost();
            }
            return;
        }

        int contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive))
                contentLength = line.mid(15).trimmed().toInt();
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive))
                hasChunkedTransfer = true;
        }

        if (hasChunkedTransfer) {
            sendHttpResponse(socket, 501, QJsonDocument(DomainFailure::invalidInput(
                QStringLiteral("chunked_body"), QStringLiteral("chunked request bodies are not supported"))
                .toJson()).toJson(QJsonDocument::Compact));
            buffer.clear();
            return;
        }
        if (contentLength < 0 || contentLength > kMaxRequestBytes) {
            sendHttpResponse(socket, 413, QJsonDocument(DomainFailure::invalidInput(
                QStringLiteral("request_too_large"), QStringLiteral("request body too large"))
                .toJson()).toJson(QJsonDocument::Compact));
            buffer.clear();
            socket->disconnectFromHost();
            return;
        }

        const int bodyStart = headerEnd + 4;
        const int totalRequired = bodyStart + contentLength;
        if (buffer.size() < totalRequired)
            return;

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        handleRequest(socket, parseHttpRequest(requestData));

        if (socket->state() != QAbstractSocket::ConnectedState)
            return;
    }
}

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return req;

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Parse the request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    req.contentLength = req.body.size();
    req.complete = !req.method.isEmpty();

    return req;
}

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    if (!request.complete) {
        sendHttpResponse(socket, 400, QJsonDocument(DomainFailure::invalidInput(
            QStringLiteral("malformed_request"), QStringLiteral("malformed request line"))
            .toJson()).toJson(QJsonDocument::Compact));
        return;
    }

    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    if (m_admin && AdminApi::handles(request.path)) {
        const auto reply = m_admin->handle(request.method, request.path, request.body);
        if (reply) {
            sendHttpResponse(socket, reply->status, reply->body);
            return;
        }
    }

    dispatchAsync(socket, request);
}

void ProxyServer::dispatchAsync(QTcpSocket* socket, const HttpRequest& request)
{
    Connection& conn = m_connections[socket];
    conn.busy = true;
    conn.cancel = makeCancelToken();

    InboundRequest inbound;
    inbound.method = request.method;
    inbound.path = request.path;
    inbound.headers = request.headers;
    inbound.body = request.body;

    const CancelToken cancel = conn.cancel;
    QPointer<QTcpSocket> target = socket;
    QPointer<ProxyServer> self = this;
    RequestDispatcher& dispatcher = m_dispatcher;

    m_workers.start([inbound, cancel, target, self, &dispatcher]() {
        if (!self)
            return;
        SocketResponseSink sink(self, target);
        const DispatchOutcome outcome = dispatcher.dispatch(inbound, cancel, &sink);
        QMetaObject::invokeMethod(self, [self, target, outcome]() {
            if (self && target)
                self->finishRequest(target, outcome);
        }, Qt::QueuedConnection);
    });
}

void ProxyServer::finishRequest(QTcpSocket* socket, const DispatchOutcome& outcome)
{
    const auto it = m_connections.find(socket);
    if (it == m_connections.end())
        return;
    it->busy = false;
    it->cancel.reset();

    if (outcome.response) {
        const ProviderResponse& resp = *outcome.response;
        if (!resp.streamed) {
            QString contentType = resp.header(QStringLiteral("content-type"));
            if (contentType.isEmpty())
                contentType = QStringLiteral("application/json");
            QMap<QString, QString> extra;
            extra[QStringLiteral("X-Switchboard-Provider")] = outcome.providerId;
            sendHttpResponse(socket, resp.statusCode, resp.body, contentType, extra);
        }
    } else if (outcome.failure) {
        if (outcome.failure->kind == ErrorKind::Cancelled)
            return;
        sendHttpResponse(socket, outcome.httpStatus(), outcome.errorBody());
    }

    processBuffer(socket);
}

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType,
                                   const QMap<QString, QString>& extraHeaders)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState)
        return;

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText(status))
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    for (auto it = extraHeaders.cbegin(); it != extraHeaders.cend(); ++it) {
        if (!it.value().isEmpty())
            response.append(QStringLiteral("%1: %2\r\n").arg(it.key(), it.value()).toUtf8());
    }
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
}
