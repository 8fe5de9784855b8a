#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QTcpSocket>

// Relays an upstream event stream to the caller with chunked transfer
// encoding. Upstream bytes are forwarded as-is.
class SseWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket, int status,
                                  const QMap<QString, QString>& upstreamHeaders);
    static void sendChunk(QTcpSocket* socket, const QByteArray& data);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
};
