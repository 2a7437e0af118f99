#include "header_filter_middleware.h"

bool HeaderFilterMiddleware::isForwardable(const QByteArray& lowerName)
{
    if (http_codec::isHopByHop(lowerName))
        return false;
    return lowerName != "host"
        && lowerName != "content-length"
        && lowerName != "accept-encoding"
        && lowerName != "authorization"
        && lowerName != "expect";
}

Result<OutboundCall> HeaderFilterMiddleware::onOutbound(OutboundCall call)
{
    call.headers.removeIf([](const QPair<QByteArray, QByteArray>& h) {
        return !isForwardable(h.first);
    });
    return call;
}
