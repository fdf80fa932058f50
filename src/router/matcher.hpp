#ifndef BEXT_ROUTER_MATCHER_HPP
#define BEXT_ROUTER_MATCHER_HPP

#include "router/cache.hpp"
#include "router/module_loader.hpp"
#include "router/types.hpp"
#include "router_config.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Bext {

class RouteMatcher {
public:
    explicit RouteMatcher(const RouterOptions &options = {},
                          std::shared_ptr<ModuleLoader> modules = nullptr,
                          RouteCache::TimeSource now = {});

    /* Throws RouteError(INVALID_ROUTE) when a required field is missing */
    void add(Route route);

    /*
     * First route, in registration order, whose pattern matches `pathname`.
     * nullptr when nothing matches or the path lies outside the prefix.
     */
    auto match(const std::string &method, const std::string &pathname)
        -> std::shared_ptr<const RouteMatch>;

    /* Every registered route once, in registration order */
    auto getRoutes() const -> std::vector<std::shared_ptr<const Route>>;

    ModuleLoader &modules() { return *modules_; }
    RouteCache *cache() { return cache_.get(); }
    const std::string &prefix() const { return prefix_; }

    /* Number of times the route table was scanned, cache hits excluded */
    size_t scanCount() const { return scan_count_.load(); }

private:
    auto findMatchingRoute(HttpMethod method, const std::string &pathname)
        -> std::shared_ptr<const RouteMatch>;

    std::map<HttpMethod, std::vector<std::shared_ptr<const Route>>> routes_;
    std::vector<std::shared_ptr<const Route>> registration_order_;
    std::unique_ptr<RouteCache> cache_;
    std::shared_ptr<ModuleLoader> modules_;
    std::string prefix_;
    std::atomic<size_t> scan_count_{0};
};

} // namespace Bext

#endif
