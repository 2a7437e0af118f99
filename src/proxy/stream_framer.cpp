#include "stream_framer.h"

BodyMode StreamFramer::detectMode(const QByteArray& contentType, bool hasContentLength)
{
    const QByteArray type = contentType.trimmed().toLower();
    if (type.startsWith("text/event-stream"))
        return BodyMode::StreamEvents;
    if (type.startsWith("application/x-ndjson") || type.startsWith("application/jsonl"))
        return BodyMode::StreamLines;
    if (!hasContentLength)
        return BodyMode::StreamRaw;
    return BodyMode::Buffered;
}

qsizetype StreamFramer::nextEventEnd() const
{
    // SSE events are delimited by a blank line. "\r\n\r\n" is checked first
    // so a CRLF stream is not cut inside its delimiter.
    const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
    const qsizetype lfPos = m_buffer.indexOf("\n\n");

    if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos))
        return crlfPos + 4;
    if (lfPos >= 0)
        return lfPos + 2;
    return -1;
}

QList<QByteArray> StreamFramer::feed(const QByteArray& data)
{
    QList<QByteArray> units;
    if (data.isEmpty())
        return units;

    switch (m_mode) {
    case BodyMode::StreamRaw:
        units.append(data);
        return units;

    case BodyMode::Buffered:
        m_buffer.append(data);
        return units;

    case BodyMode::StreamLines:
        m_buffer.append(data);
        while (true) {
            const qsizetype nl = m_buffer.indexOf('\n');
            if (nl < 0)
                break;
            units.append(m_buffer.left(nl + 1));
            m_buffer.remove(0, nl + 1);
        }
        return units;

    case BodyMode::StreamEvents:
        m_buffer.append(data);
        while (true) {
            const qsizetype end = nextEventEnd();
            if (end < 0)
                break;
            units.append(m_buffer.left(end));
            m_buffer.remove(0, end);
        }
        return units;
    }
    return units;
}

QByteArray StreamFramer::flush()
{
    QByteArray rest;
    rest.swap(m_buffer);
    return rest;
}
