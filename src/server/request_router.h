#pragma once
#include <QString>
#include <QList>
#include <optional>

enum class RouteKind {
    Greeting,
    Messages,
    Artifact
};

struct RouteMatch {
    RouteKind kind;
    QString remainder;   // path below a wildcard prefix
};

class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const QString& method, const QString& pathPattern, RouteKind kind);
    std::optional<RouteMatch> match(const QString& method, const QString& path) const;

private:
    struct InternalRoute {
        QString method;      // HTTP method ("POST", "GET", or "*" for any)
        QString pathPrefix;  // URL path prefix for matching
        bool wildcard = false; // true if pathPattern ends with "*"
        RouteKind kind = RouteKind::Greeting;
    };
    QList<InternalRoute> m_routes;
};
