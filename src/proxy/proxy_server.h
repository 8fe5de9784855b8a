#pragma once
#include "admin_api.h"
#include "config/config_types.h"
#include "dispatch/request_dispatcher.h"
#include <QHash>
#include <QHostAddress>
#include <QMap>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThreadPool>

// Plain HTTP/1.1 listener on the loopback interface. Parsing and socket I/O
// stay on the owning thread; each request is dispatched on the worker pool.
class ProxyServer : public QObject {
    Q_OBJECT
public:
    ProxyServer(RequestDispatcher& dispatcher, AdminApi* admin, QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start(const RuntimeOptions& options);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    static bool isPortInUse(const QHostAddress& address, int port);

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool complete = false;
        int contentLength = 0;
    };

    struct Connection {
        QByteArray pending;
        CancelToken cancel;
        bool busy = false;
    };

    void processBuffer(QTcpSocket* socket);
    HttpRequest parseHttpRequest(const QByteArray& data);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void dispatchAsync(QTcpSocket* socket, const HttpRequest& request);
    void finishRequest(QTcpSocket* socket, const DispatchOutcome& outcome);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"),
                          const QMap<QString, QString>& extraHeaders = {});

    RequestDispatcher& m_dispatcher;
    AdminApi* m_admin = nullptr;
    QTcpServer* m_server = nullptr;
    QThreadPool m_workers;
    QHash<QTcpSocket*, Connection> m_connections;
};
