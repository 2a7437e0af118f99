#include "pipeline.h"

void Pipeline::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

Result<OutboundCall> Pipeline::process(OutboundCall call) const {
    for (const auto& mw : m_middlewares) {
        auto r = mw->onOutbound(std::move(call));
        if (!r) return std::unexpected(r.error());
        call = std::move(*r);
    }
    return call;
}

QStringList Pipeline::middlewareNames() const {
    QStringList names;
    for (const auto& mw : m_middlewares)
        names.append(mw->name());
    return names;
}
