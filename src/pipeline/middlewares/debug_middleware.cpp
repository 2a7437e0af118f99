#include "debug_middleware.h"
#include "core/log_manager.h"

Result<OutboundCall> DebugMiddleware::onOutbound(OutboundCall call) {
    if (m_enabled) {
        QStringList headerNames;
        for (const auto& h : call.headers) {
            headerNames.append(h.first == "authorization"
                                   ? QStringLiteral("authorization=<redacted>")
                                   : QString::fromLatin1(h.first));
        }
        LOG_DEBUG(QStringLiteral("[Debug] Outbound: %1 %2 provider=%3 model=%4 bytes=%5 headers=[%6]")
            .arg(call.method, call.url.toString(QUrl::RemoveUserInfo), call.provider.name,
                 call.nativeModel)
            .arg(call.body.size())
            .arg(headerNames.join(QLatin1Char(','))));
    }
    return call;
}
