#pragma once
#include "middleware.h"
#include <memory>
#include <vector>

// Ordered chain of middlewares applied to every outbound call.
class Pipeline {
public:
    Pipeline() = default;
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);
    Result<OutboundCall> process(OutboundCall call) const;

    QStringList middlewareNames() const;

private:
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;
};
