#pragma once
#include "pipeline/middleware.h"

class DebugMiddleware : public IPipelineMiddleware {
public:
    explicit DebugMiddleware(bool enabled = false) : m_enabled(enabled) {}
    QString name() const override { return "debug"; }
    Result<OutboundCall> onOutbound(OutboundCall call) override;

private:
    bool m_enabled;
};
