#include "http_codec.h"
#include <QHash>

bool InboundRequest::keepAlive() const
{
    const QString connection = headers.value(QStringLiteral("connection")).toLower();
    if (isHttp10())
        return connection.contains(QStringLiteral("keep-alive"));
    return !connection.contains(QStringLiteral("close"));
}

namespace http_codec {

Result<std::optional<InboundRequest>> takeRequest(QByteArray& buffer, qint64 maxBodyBytes)
{
    const int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (buffer.size() > kMaxHeadBytes) {
            return std::unexpected(DomainFailure::headerTooLarge(
                QStringLiteral("request head exceeds %1 bytes").arg(kMaxHeadBytes)));
        }
        return std::optional<InboundRequest>{};
    }
    if (headerEnd > kMaxHeadBytes) {
        return std::unexpected(DomainFailure::headerTooLarge(
            QStringLiteral("request head exceeds %1 bytes").arg(kMaxHeadBytes)));
    }

    InboundRequest req;
    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');

    // Request line: "METHOD TARGET HTTP/1.x"
    const QList<QByteArray> parts = lines.first().trimmed().split(' ');
    if (parts.size() != 3 || !parts[2].startsWith("HTTP/1.") || !parts[1].startsWith('/')) {
        return std::unexpected(DomainFailure::malformedRequest(
            QStringLiteral("bad_request_line"), QStringLiteral("malformed request line")));
    }
    req.method      = QString::fromLatin1(parts[0]).toUpper();
    req.target      = QString::fromUtf8(parts[1]);
    req.httpVersion = QString::fromLatin1(parts[2]);

    const int q = req.target.indexOf(QLatin1Char('?'));
    req.path  = q < 0 ? req.target : req.target.left(q);
    req.query = q < 0 ? QString() : req.target.mid(q + 1);

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty())
            continue;
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            return std::unexpected(DomainFailure::malformedRequest(
                QStringLiteral("bad_header"), QStringLiteral("malformed header line")));
        }
        const QByteArray key = line.left(colon).trimmed().toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        req.rawHeaders.append({key, value});
        req.headers[QString::fromLatin1(key)] = QString::fromUtf8(value);
    }

    if (req.headers.value(QStringLiteral("transfer-encoding")).contains(
            QStringLiteral("chunked"), Qt::CaseInsensitive)) {
        return std::unexpected(DomainFailure::notSupported(
            QStringLiteral("chunked_request"), QStringLiteral("chunked request bodies are not supported")));
    }

    qint64 contentLength = 0;
    if (req.headers.contains(QStringLiteral("content-length"))) {
        bool ok = false;
        contentLength = req.headers.value(QStringLiteral("content-length")).toLongLong(&ok);
        if (!ok || contentLength < 0) {
            return std::unexpected(DomainFailure::malformedRequest(
                QStringLiteral("bad_content_length"), QStringLiteral("invalid Content-Length")));
        }
    }
    if (contentLength > maxBodyBytes) {
        return std::unexpected(DomainFailure::payloadTooLarge(
            QStringLiteral("request body of %1 bytes exceeds the %2 byte limit")
                .arg(contentLength).arg(maxBodyBytes)));
    }

    const qint64 bodyStart = headerEnd + 4;
    if (buffer.size() < bodyStart + contentLength)
        return std::optional<InboundRequest>{};

    req.body = buffer.mid(bodyStart, contentLength);
    buffer.remove(0, bodyStart + contentLength);
    return std::optional<InboundRequest>(std::move(req));
}

QByteArray statusText(int status)
{
    static const QHash<int, QByteArray> statusTexts = {
        {200, "OK"},
        {201, "Created"},
        {204, "No Content"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {304, "Not Modified"},
        {307, "Temporary Redirect"},
        {308, "Permanent Redirect"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {408, "Request Timeout"},
        {413, "Payload Too Large"},
        {422, "Unprocessable Entity"},
        {429, "Too Many Requests"},
        {431, "Request Header Fields Too Large"},
        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"}
    };
    return statusTexts.value(status, "Unknown");
}

QByteArray responseHead(int status, const HeaderList& headers)
{
    QByteArray head;
    head.append("HTTP/1.1 ");
    head.append(QByteArray::number(status));
    head.append(' ');
    head.append(statusText(status));
    head.append("\r\n");
    for (const auto& h : headers) {
        head.append(h.first);
        head.append(": ");
        head.append(h.second);
        head.append("\r\n");
    }
    head.append("\r\n");
    return head;
}

QByteArray wrapChunked(const QByteArray& data)
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

QByteArray chunkTerminator()
{
    return QByteArrayLiteral("0\r\n\r\n");
}

bool isHopByHop(const QByteArray& lowerName)
{
    return lowerName == "connection"
        || lowerName == "keep-alive"
        || lowerName == "proxy-connection"
        || lowerName == "proxy-authenticate"
        || lowerName == "proxy-authorization"
        || lowerName == "te"
        || lowerName == "trailer"
        || lowerName == "transfer-encoding"
        || lowerName == "upgrade";
}

} // namespace http_codec
