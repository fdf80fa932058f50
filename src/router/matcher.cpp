#include "router/matcher.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "router/parser.hpp"
#include <algorithm>
#include <cctype>

namespace Bext {

RouteHandler HandlerLoader::load() const {
    std::shared_ptr<const RouteModule> module;
    try {
        module = modules_->load(route_->file);
    } catch (const RouteError &) {
        throw;
    } catch (const std::exception &e) {
        throw RouteError("Failed to load route handler: " + route_->file + ". Reason: " + e.what(),
                         ErrorCode::HANDLER_LOAD_ERROR);
    }

    return [module](Context &ctx) {
        const std::string method = HttpMethodToString(ctx.request().getMethod());
        if (const RouteHandler *handler = module->find(method)) {
            (*handler)(ctx);
            return;
        }
        if (const RouteHandler *fallback = module->find(kDefaultExport)) {
            (*fallback)(ctx);
            return;
        }
        throw RouteError("Route handler must export either a '" + method +
                             "' function or a default function: " + module->file(),
                         ErrorCode::INVALID_HANDLER);
    };
}

RouteMatcher::RouteMatcher(const RouterOptions &options, std::shared_ptr<ModuleLoader> modules,
                           RouteCache::TimeSource now)
    : modules_(modules ? std::move(modules) : std::make_shared<SharedLibraryLoader>()),
      prefix_(options.prefix) {
    if (options.cache) {
        cache_ = std::make_unique<RouteCache>(options.cache_ttl, std::move(now));
    }
}

void RouteMatcher::add(Route route) {
    if (route.methods.empty() || route.path.empty() || route.file.empty() || !route.pattern) {
        throw RouteError("Route is missing required properties", ErrorCode::INVALID_ROUTE);
    }

    auto shared = std::make_shared<const Route>(std::move(route));
    for (HttpMethod method : shared->methods) {
        routes_[method].push_back(shared);
    }
    registration_order_.push_back(shared);
}

auto RouteMatcher::match(const std::string &method, const std::string &pathname)
    -> std::shared_ptr<const RouteMatch> {
    if (method.empty()) {
        throw RouteError("Method must be a string", ErrorCode::INVALID_METHOD);
    }
    if (pathname.empty()) {
        throw RouteError("Pathname must be a string", ErrorCode::INVALID_PATH);
    }

    std::string normalized_method = method;
    std::transform(normalized_method.begin(), normalized_method.end(), normalized_method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string match_path = pathname;
    if (!prefix_.empty()) {
        if (pathname.compare(0, prefix_.size(), prefix_) != 0) {
            return nullptr;
        }
        match_path = pathname.substr(prefix_.size());
        if (!match_path.empty() && match_path[0] != '/') {
            match_path.insert(match_path.begin(), '/');
        }
    }

    const std::string cache_key = normalized_method + ":" + match_path;
    if (cache_) {
        if (auto cached = cache_->get(cache_key)) {
            return cached;
        }
    }

    auto found = findMatchingRoute(stringToHttpMethod(normalized_method), match_path);
    if (!found) {
        return nullptr;
    }

    if (cache_) {
        cache_->set(cache_key, found);
    }
    return found;
}

auto RouteMatcher::getRoutes() const -> std::vector<std::shared_ptr<const Route>> {
    return registration_order_;
}

auto RouteMatcher::findMatchingRoute(HttpMethod method, const std::string &pathname)
    -> std::shared_ptr<const RouteMatch> {
    scan_count_++;
    auto it = routes_.find(method);
    if (it == routes_.end()) {
        return nullptr;
    }

    for (const auto &route : it->second) {
        auto captures = matchRoutePattern(*route->pattern, pathname);
        if (!captures) {
            continue;
        }

        RouteParams params;
        for (size_t i = 0; i < route->keys.size() && i < captures->size(); i++) {
            params.set(route->keys[i], std::move((*captures)[i]));
        }

        defaultLogger().debug("Matched " + HttpMethodToString(method) + " " + pathname +
                              " -> " + route->path);
        return std::make_shared<const RouteMatch>(
            RouteMatch{std::move(params), HandlerLoader(route, modules_), {}});
    }
    return nullptr;
}

} // namespace Bext
