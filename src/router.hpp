#ifndef BEXT_ROUTER_HPP
#define BEXT_ROUTER_HPP

#include "http/http_request.hpp"
#include "router/matcher.hpp"
#include "router/module_loader.hpp"
#include "router/types.hpp"
#include "router_config.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Bext {

/*
 * Routes discovered from a directory tree. Each instance walks its directory
 * at most once; routes never change after initialization.
 */
class Router {
public:
    Router(const std::string &baseDir, const RouterOptions &options = {},
           std::shared_ptr<ModuleLoader> modules = nullptr, RouteCache::TimeSource now = {});

    Router(const Router &) = delete;
    Router &operator=(const Router &) = delete;

    /* Walks the routes directory; a no-op after the first success */
    void initialize();

    bool initialized() const;

    auto match(const HttpRequest &request) -> std::shared_ptr<const RouteMatch>;

    auto routes() const -> std::vector<std::shared_ptr<const Route>> { return matcher_.getRoutes(); }

    const std::string &routesDir() const { return routes_dir_; }

    RouteMatcher &matcher() { return matcher_; }

private:
    std::string routes_dir_;
    RouteMatcher matcher_;
    mutable std::mutex init_mutex_;
    bool initialized_ = false;
};

/* Builds a router over `baseDir` and loads its routes; startup errors propagate */
auto createRouter(const std::string &baseDir, const RouterOptions &options = {},
                  std::shared_ptr<ModuleLoader> modules = nullptr) -> std::unique_ptr<Router>;

} // namespace Bext

#endif
