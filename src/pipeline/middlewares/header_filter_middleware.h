#pragma once
#include "pipeline/middleware.h"

// Drops headers that describe the local leg rather than the payload.
class HeaderFilterMiddleware : public IPipelineMiddleware {
public:
    QString name() const override { return "header_filter"; }
    Result<OutboundCall> onOutbound(OutboundCall call) override;

    static bool isForwardable(const QByteArray& lowerName);
};
