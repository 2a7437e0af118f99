#pragma once
#include "outbound_call.h"
#include "core/result.h"

class IPipelineMiddleware {
public:
    virtual ~IPipelineMiddleware() = default;
    virtual QString name() const = 0;
    virtual Result<OutboundCall> onOutbound(OutboundCall call) = 0;
};
