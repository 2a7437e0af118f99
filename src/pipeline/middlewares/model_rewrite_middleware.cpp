#include "model_rewrite_middleware.h"
#include <QJsonDocument>

Result<OutboundCall> ModelRewriteMiddleware::onOutbound(OutboundCall call) {
    if (call.nativeModel.isEmpty()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("model rewrite reached without a resolved model")));
    }

    call.payload[QStringLiteral("model")] = call.nativeModel;
    call.body = QJsonDocument(call.payload).toJson(QJsonDocument::Compact);
    call.setHeader("content-type", "application/json");
    return call;
}
