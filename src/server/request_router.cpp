#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    // GET /api/v1/messages -> liveness greeting
    addRoute(QStringLiteral("GET"), QStringLiteral("/api/v1/messages"), RouteKind::Greeting);

    // POST /api/v1/messages -> agent event stream
    addRoute(QStringLiteral("POST"), QStringLiteral("/api/v1/messages"), RouteKind::Messages);

    // GET /api/videos/<executionId>/<filename> -> rendered artifact
    addRoute(QStringLiteral("GET"), QStringLiteral("/api/videos/*"), RouteKind::Artifact);

    LOG_INFO(QStringLiteral("RequestRouter: registered %1 default routes")
                 .arg(m_routes.size()));
}

void RequestRouter::addRoute(const QString& method, const QString& pathPattern, RouteKind kind)
{
    InternalRoute entry;
    entry.method = method.trimmed().toUpper();
    entry.kind = kind;

    // Handle wildcard paths: "/some/prefix/*"
    if (pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = pathPattern.left(pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = pathPattern;
    }

    m_routes.append(entry);
}

std::optional<RouteMatch> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();

    // The query string never takes part in routing
    QString cleanPath = path;
    const int query = cleanPath.indexOf(QLatin1Char('?'));
    if (query >= 0)
        cleanPath.truncate(query);

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod) {
            continue;
        }

        // Path check: wildcard routes use startsWith; exact routes require equality
        if (entry.wildcard) {
            if (cleanPath.startsWith(entry.pathPrefix)) {
                return RouteMatch{entry.kind, cleanPath.mid(entry.pathPrefix.size())};
            }
        } else {
            if (cleanPath == entry.pathPrefix) {
                return RouteMatch{entry.kind, QString()};
            }
        }
    }

    return std::nullopt;
}
