#include "response_writer.h"
#include "core/log_manager.h"

bool ResponseWriter::writable(QTcpSocket* socket, const char* what)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("ResponseWriter: cannot %1, socket not connected")
                      .arg(QLatin1String(what)));
        return false;
    }
    return true;
}

HeaderList ResponseWriter::commonHeaders(bool keepAlive)
{
    HeaderList headers;
    headers.append({"access-control-allow-origin", "*"});
    headers.append({"connection", keepAlive ? QByteArray("keep-alive") : QByteArray("close")});
    return headers;
}

bool ResponseWriter::sendResponse(QTcpSocket* socket, int status, const QByteArray& body,
                                  const QByteArray& contentType, bool keepAlive,
                                  const HeaderList& extraHeaders)
{
    if (!writable(socket, "send response"))
        return false;

    HeaderList headers = extraHeaders;
    if (!contentType.isEmpty())
        headers.append({"content-type", contentType});
    headers.append({"content-length", QByteArray::number(body.size())});
    headers.append(commonHeaders(keepAlive));

    QByteArray response = http_codec::responseHead(status, headers);
    response.append(body);
    socket->write(response);
    socket->flush();
    return true;
}

bool ResponseWriter::writeStreamHead(QTcpSocket* socket, int status, HeaderList headers, bool chunked)
{
    if (!writable(socket, "write stream head"))
        return false;

    if (chunked)
        headers.append({"transfer-encoding", "chunked"});
    headers.append({"cache-control", "no-cache"});
    headers.append(commonHeaders(chunked));

    socket->write(http_codec::responseHead(status, headers));
    socket->flush();
    return true;
}

bool ResponseWriter::sendChunk(QTcpSocket* socket, const QByteArray& data, bool chunked)
{
    if (!writable(socket, "send chunk"))
        return false;
    if (data.isEmpty())
        return true;

    socket->write(chunked ? http_codec::wrapChunked(data) : data);
    socket->flush();
    return true;
}

bool ResponseWriter::sendTerminator(QTcpSocket* socket, bool chunked)
{
    if (!writable(socket, "send terminator"))
        return false;

    // The zero-length chunk signals end of chunked transfer
    if (chunked) {
        socket->write(http_codec::chunkTerminator());
        socket->flush();
    }
    return true;
}
