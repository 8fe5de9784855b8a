#include "sse_writer.h"
#include "core/log_manager.h"

namespace {

bool writable(QTcpSocket* socket, const char* what)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot %1, socket not connected").arg(QLatin1String(what)));
        return false;
    }
    return true;
}

}

void SseWriter::writeStreamHeader(QTcpSocket* socket, int status,
                                  const QMap<QString, QString>& upstreamHeaders)
{
    if (!writable(socket, "write stream header"))
        return;

    QString contentType = upstreamHeaders.value(QStringLiteral("content-type"));
    if (contentType.isEmpty())
        contentType = QStringLiteral("text/event-stream");

    QByteArray header;
    header.append(QStringLiteral("HTTP/1.1 %1 OK\r\n").arg(status).toUtf8());
    header.append(QStringLiteral("Content-Type: %1\r\n").arg(contentType).toUtf8());
    header.append("Cache-Control: no-cache\r\n");
    header.append("Connection: keep-alive\r\n");
    header.append("Transfer-Encoding: chunked\r\n");
    const QString requestId = upstreamHeaders.value(QStringLiteral("request-id"),
                                                    upstreamHeaders.value(QStringLiteral("x-request-id")));
    if (!requestId.isEmpty())
        header.append(QStringLiteral("X-Request-Id: %1\r\n").arg(requestId).toUtf8());
    header.append("\r\n");

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void SseWriter::sendChunk(QTcpSocket* socket, const QByteArray& data)
{
    // An empty chunk would terminate the body.
    if (data.isEmpty() || !writable(socket, "send chunk"))
        return;

    socket->write(wrapChunked(data));
    socket->flush();
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!writable(socket, "send terminator"))
        return;

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}
