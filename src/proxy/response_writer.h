#pragma once
#include "http_codec.h"
#include <QTcpSocket>

class ResponseWriter {
public:
    static bool sendResponse(QTcpSocket* socket, int status, const QByteArray& body,
                             const QByteArray& contentType, bool keepAlive,
                             const HeaderList& extraHeaders = {});

    // Head of a body of unknown length. Chunked for HTTP/1.1, close-delimited for 1.0.
    static bool writeStreamHead(QTcpSocket* socket, int status, HeaderList headers, bool chunked);
    static bool sendChunk(QTcpSocket* socket, const QByteArray& data, bool chunked);
    static bool sendTerminator(QTcpSocket* socket, bool chunked);

    static HeaderList commonHeaders(bool keepAlive);

private:
    static bool writable(QTcpSocket* socket, const char* what);
};
