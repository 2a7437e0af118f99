#include "outbound_call.h"

QByteArray OutboundCall::header(const QByteArray& name) const
{
    const QByteArray key = name.toLower();
    for (const auto& h : headers) {
        if (h.first == key)
            return h.second;
    }
    return {};
}

bool OutboundCall::hasHeader(const QByteArray& name) const
{
    const QByteArray key = name.toLower();
    for (const auto& h : headers) {
        if (h.first == key)
            return true;
    }
    return false;
}

void OutboundCall::setHeader(const QByteArray& name, const QByteArray& value)
{
    removeHeader(name);
    headers.append({name.toLower(), value});
}

void OutboundCall::removeHeader(const QByteArray& name)
{
    const QByteArray key = name.toLower();
    headers.removeIf([&key](const QPair<QByteArray, QByteArray>& h) {
        return h.first == key;
    });
}
