#pragma once
#include "http_codec.h"
#include "model_resolver.h"
#include "pipeline/pipeline.h"
#include <QString>
#include <QList>
#include <optional>

enum class RouteKind : quint8 {
    Health, Version, Tags, Models, Relay
};

struct Route {
    QString method;
    QString path;
    RouteKind kind = RouteKind::Relay;
    Dialect dialect = Dialect::Ollama;
};

class RequestRouter {
public:
    RequestRouter(std::shared_ptr<const ProviderTable> table,
                  UnknownModelPolicy policy,
                  bool debugMode = false);

    void registerDefaults();
    void addRoute(const Route& route);
    std::optional<Route> match(const QString& method, const QString& path) const;

    // Dialect used to word errors for a path that may not have a route.
    static Dialect dialectForPath(const QString& path);

    // Resolve the model, rewrite the body, build the upstream URL and inject auth.
    Result<OutboundCall> route(const InboundRequest& request, const Route& route) const;

    static QUrl joinUrl(const QString& baseUrl, const QString& path, const QString& query);

    const ModelResolver& resolver() const { return m_resolver; }

private:
    QList<Route> m_routes;
    ModelResolver m_resolver;
    Pipeline m_pipeline;
};
