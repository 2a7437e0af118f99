#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::UnknownProvider:
    case ErrorKind::UnknownModel:
    case ErrorKind::RouteNotFound:        return 404;
    case ErrorKind::MalformedRequest:     return 400;
    case ErrorKind::PayloadTooLarge:      return 413;
    case ErrorKind::HeaderTooLarge:       return 431;
    case ErrorKind::NotSupported:         return 501;
    case ErrorKind::UpstreamUnreachable:  return 502;
    case ErrorKind::UpstreamTimeout:      return 504;
    case ErrorKind::ConfigurationInvalid:
    case ErrorKind::Internal:
    default:                              return 500;
    }
}

QJsonObject DomainFailure::toJson(Dialect dialect) const {
    QJsonObject root;
    switch (dialect) {
    case Dialect::Ollama:
        // Ollama clients read a plain string from "error"
        root["error"] = message;
        break;
    case Dialect::OpenAI: {
        QJsonObject err;
        err["message"] = message;
        err["type"] = errorKindName(kind);
        err["code"] = code;
        root["error"] = err;
        break;
    }
    }
    return root;
}

DomainFailure DomainFailure::unknownProvider(const QString& model) {
    return {ErrorKind::UnknownProvider, "unknown_provider",
            QStringLiteral("model '%1' does not match any configured provider").arg(model)};
}

DomainFailure DomainFailure::unknownModel(const QString& provider, const QString& model) {
    return {ErrorKind::UnknownModel, "unknown_model",
            QStringLiteral("model '%1' is not served by provider '%2'").arg(model, provider)};
}

DomainFailure DomainFailure::routeNotFound(const QString& method, const QString& path) {
    return {ErrorKind::RouteNotFound, "route_not_found",
            QStringLiteral("no route for %1 %2").arg(method, path)};
}

DomainFailure DomainFailure::malformedRequest(const QString& code, const QString& msg) {
    return {ErrorKind::MalformedRequest, code, msg};
}

DomainFailure DomainFailure::payloadTooLarge(const QString& msg) {
    return {ErrorKind::PayloadTooLarge, "payload_too_large", msg};
}

DomainFailure DomainFailure::headerTooLarge(const QString& msg) {
    return {ErrorKind::HeaderTooLarge, "header_too_large", msg};
}

DomainFailure DomainFailure::notSupported(const QString& code, const QString& msg) {
    return {ErrorKind::NotSupported, code, msg};
}

DomainFailure DomainFailure::upstreamUnreachable(const QString& msg) {
    return {ErrorKind::UpstreamUnreachable, "upstream_unreachable", msg};
}

DomainFailure DomainFailure::upstreamTimeout(const QString& msg) {
    return {ErrorKind::UpstreamTimeout, "upstream_timeout", msg};
}

DomainFailure DomainFailure::configurationInvalid(const QString& msg) {
    return {ErrorKind::ConfigurationInvalid, "configuration_invalid", msg};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg};
}

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownProvider:      return QStringLiteral("unknown_provider");
    case ErrorKind::UnknownModel:         return QStringLiteral("unknown_model");
    case ErrorKind::RouteNotFound:        return QStringLiteral("not_found");
    case ErrorKind::MalformedRequest:     return QStringLiteral("invalid_request_error");
    case ErrorKind::PayloadTooLarge:      return QStringLiteral("payload_too_large");
    case ErrorKind::HeaderTooLarge:       return QStringLiteral("header_too_large");
    case ErrorKind::NotSupported:         return QStringLiteral("not_supported");
    case ErrorKind::UpstreamUnreachable:  return QStringLiteral("upstream_unreachable");
    case ErrorKind::UpstreamTimeout:      return QStringLiteral("upstream_timeout");
    case ErrorKind::ConfigurationInvalid: return QStringLiteral("configuration_invalid");
    case ErrorKind::Internal:
    default:                              return QStringLiteral("internal_error");
    }
}
