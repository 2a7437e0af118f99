#pragma once
#include "core/types.h"
#include <QByteArray>
#include <QList>

// Splits an upstream body into forwarding units without altering bytes.
// Each unit keeps its own delimiter, so concatenating the units reproduces
// the input exactly.
class StreamFramer {
public:
    explicit StreamFramer(BodyMode mode) : m_mode(mode) {}

    QList<QByteArray> feed(const QByteArray& data);
    // Trailing bytes of an unterminated last unit.
    QByteArray flush();

    BodyMode mode() const { return m_mode; }
    bool hasPending() const { return !m_buffer.isEmpty(); }

    static BodyMode detectMode(const QByteArray& contentType, bool hasContentLength);

private:
    BodyMode m_mode;
    QByteArray m_buffer;

    qsizetype nextEventEnd() const;
};
