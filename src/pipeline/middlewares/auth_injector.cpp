#include "auth_injector.h"

std::optional<QByteArray> AuthInjector::authorizationFor(ApiType apiType,
                                                         const std::optional<QString>& secret)
{
    if (!secret || secret->isEmpty())
        return std::nullopt;

    const QByteArray raw = secret->toUtf8();
    switch (apiType) {
    case ApiType::Ollama:
        if (raw.contains(':'))
            return QByteArrayLiteral("Basic ") + raw.toBase64();
        return QByteArrayLiteral("Bearer ") + raw;
    case ApiType::OpenAI:
        return QByteArrayLiteral("Bearer ") + raw;
    }
    return std::nullopt;
}

Result<OutboundCall> AuthInjector::onOutbound(OutboundCall call)
{
    // The local caller is unauthenticated; whatever it sent is never forwarded.
    call.removeHeader("authorization");

    const auto value = authorizationFor(call.provider.apiType, call.provider.secret);
    if (value)
        call.setHeader("authorization", *value);
    return call;
}
