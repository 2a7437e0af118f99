#pragma once
#include "pipeline/middleware.h"
#include <optional>

// Attaches the provider credential. Depends only on (api_type, secret):
//   Ollama + "user:pass" -> Basic base64(user:pass)
//   Ollama + token       -> Bearer token
//   OpenAI + secret      -> Bearer secret
//   no secret            -> no Authorization header
class AuthInjector : public IPipelineMiddleware {
public:
    QString name() const override { return "auth"; }
    Result<OutboundCall> onOutbound(OutboundCall call) override;

    static std::optional<QByteArray> authorizationFor(ApiType apiType,
                                                      const std::optional<QString>& secret);
};
