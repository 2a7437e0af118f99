#include "request_router.h"
#include "core/log_manager.h"
#include "pipeline/middlewares/auth_injector.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "pipeline/middlewares/header_filter_middleware.h"
#include "pipeline/middlewares/model_rewrite_middleware.h"

#include <QJsonDocument>

RequestRouter::RequestRouter(std::shared_ptr<const ProviderTable> table,
                             UnknownModelPolicy policy,
                             bool debugMode)
    : m_resolver(std::move(table), policy)
{
    m_pipeline.addMiddleware(std::make_unique<HeaderFilterMiddleware>());
    m_pipeline.addMiddleware(std::make_unique<ModelRewriteMiddleware>());
    m_pipeline.addMiddleware(std::make_unique<AuthInjector>());
    m_pipeline.addMiddleware(std::make_unique<DebugMiddleware>(debugMode));

    registerDefaults();
}

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    // Answered locally
    addRoute({QStringLiteral("GET"),  QStringLiteral("/"),            RouteKind::Health,  Dialect::Ollama});
    addRoute({QStringLiteral("HEAD"), QStringLiteral("/"),            RouteKind::Health,  Dialect::Ollama});
    addRoute({QStringLiteral("GET"),  QStringLiteral("/api/version"), RouteKind::Version, Dialect::Ollama});
    addRoute({QStringLiteral("GET"),  QStringLiteral("/api/tags"),    RouteKind::Tags,    Dialect::Ollama});
    addRoute({QStringLiteral("GET"),  QStringLiteral("/v1/models"),   RouteKind::Models,  Dialect::OpenAI});

    // Native Ollama shapes
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/chat"),       RouteKind::Relay, Dialect::Ollama});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/generate"),   RouteKind::Relay, Dialect::Ollama});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/embed"),      RouteKind::Relay, Dialect::Ollama});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/embeddings"), RouteKind::Relay, Dialect::Ollama});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/show"),       RouteKind::Relay, Dialect::Ollama});

    // OpenAI-compatible shapes
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/chat/completions"), RouteKind::Relay, Dialect::OpenAI});
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/completions"),      RouteKind::Relay, Dialect::OpenAI});
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/embeddings"),       RouteKind::Relay, Dialect::OpenAI});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    Route entry = route;
    entry.method = route.method.trimmed().toUpper();
    m_routes.append(entry);
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    QString normalizedPath = path;
    while (normalizedPath.size() > 1 && normalizedPath.endsWith(QLatin1Char('/')))
        normalizedPath.chop(1);

    for (const Route& entry : m_routes) {
        if (entry.method == normalizedMethod && entry.path == normalizedPath)
            return entry;
    }
    return std::nullopt;
}

Dialect RequestRouter::dialectForPath(const QString& path)
{
    return path.startsWith(QStringLiteral("/v1/")) ? Dialect::OpenAI : Dialect::Ollama;
}

QUrl RequestRouter::joinUrl(const QString& baseUrl, const QString& path, const QString& query)
{
    QString base = baseUrl;
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);

    QString joined = base + path;
    if (!query.isEmpty())
        joined += QLatin1Char('?') + query;
    return QUrl(joined, QUrl::TolerantMode);
}

Result<OutboundCall> RequestRouter::route(const InboundRequest& request, const Route& route) const
{
    // Extract the model identifier from the body
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(request.body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::malformedRequest(
            QStringLiteral("invalid_json"),
            QStringLiteral("request body must be a JSON object")));
    }

    const QJsonObject payload = doc.object();
    const QJsonValue modelValue = payload.value(QStringLiteral("model"));
    if (!modelValue.isString() || modelValue.toString().isEmpty()) {
        return std::unexpected(DomainFailure::malformedRequest(
            QStringLiteral("missing_model"),
            QStringLiteral("request body has no \"model\" field")));
    }
    const QString taggedModel = modelValue.toString();

    // Resolve provider and native model
    auto resolved = m_resolver.resolve(taggedModel);
    if (!resolved)
        return std::unexpected(resolved.error());

    const Provider& provider = *resolved->provider;
    if ((provider.apiType == ApiType::Ollama) != (route.dialect == Dialect::Ollama)) {
        LOG_WARNING(QStringLiteral("RequestRouter: %1 is a %2 endpoint but provider '%3' speaks %4; forwarding unchanged")
                        .arg(request.path,
                             route.dialect == Dialect::Ollama ? QStringLiteral("Ollama") : QStringLiteral("OpenAI"),
                             provider.name, apiTypeName(provider.apiType)));
    }

    OutboundCall call;
    call.method = request.method;
    call.headers = request.rawHeaders;
    call.payload = payload;
    call.provider = provider;
    call.taggedModel = taggedModel;
    call.nativeModel = resolved->nativeModel;
    call.dialect = route.dialect;

    // Provider base URL + inbound path and query
    call.url = joinUrl(provider.url, request.path, request.query);
    if (!call.url.isValid()) {
        return std::unexpected(DomainFailure::malformedRequest(
            QStringLiteral("bad_target"),
            QStringLiteral("cannot build upstream url for %1").arg(request.target)));
    }

    // Body rewrite and auth injection run in the pipeline
    return m_pipeline.process(std::move(call));
}
