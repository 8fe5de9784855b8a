#pragma once
#include "semantic/ports.h"
#include "proxy/connection_pool.h"
#include <QNetworkRequest>

class QNetworkReply;

// Blocking HTTP executor for worker threads. Runs a local event loop per
// request and forwards 2xx event streams to the sink as they arrive.
class QtExecutor : public IExecutor {
public:
    explicit QtExecutor(ConnectionPool& pool);

    Result<ProviderResponse> execute(const ProviderRequest& request,
                                     const ExecOptions& options) override;

private:
    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    static QNetworkReply* send(QNetworkAccessManager* nam, const QNetworkRequest& req,
                               const ProviderRequest& request);
    static QMap<QString, QString> collectHeaders(const QNetworkReply* reply);

    ConnectionPool& m_pool;
};
