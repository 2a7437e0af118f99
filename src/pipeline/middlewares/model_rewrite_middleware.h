#pragma once
#include "pipeline/middleware.h"

// Replaces the tagged model in the body with the native one and
// serializes the payload that goes upstream.
class ModelRewriteMiddleware : public IPipelineMiddleware {
public:
    QString name() const override { return "model_rewrite"; }
    Result<OutboundCall> onOutbound(OutboundCall call) override;
};
