#include "router.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "router/walker.hpp"
#include <filesystem>

namespace Bext {

namespace {

std::string resolveRoutesDir(const std::string &baseDir) {
    std::filesystem::path dir(baseDir);
    if (dir.is_absolute()) {
        return dir.lexically_normal().string();
    }
    return (std::filesystem::current_path() / dir).lexically_normal().string();
}

} // namespace

Router::Router(const std::string &baseDir, const RouterOptions &options,
               std::shared_ptr<ModuleLoader> modules, RouteCache::TimeSource now)
    : routes_dir_(resolveRoutesDir(baseDir)),
      matcher_(options, std::move(modules), std::move(now)) {
    if (options.debug) {
        defaultLogger().set_log_level(LogLevel::DEBUG);
    }
}

void Router::initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return;
    }
    try {
        walk(routes_dir_, "", matcher_);
    } catch (const std::exception &e) {
        defaultLogger().error("Failed to initialize routes: " + describeError(e));
        throw;
    }
    initialized_ = true;
    defaultLogger().info(std::to_string(matcher_.getRoutes().size()) +
                         " routes registered from " + routes_dir_);
}

bool Router::initialized() const {
    std::lock_guard<std::mutex> lock(init_mutex_);
    return initialized_;
}

auto Router::match(const HttpRequest &request) -> std::shared_ptr<const RouteMatch> {
    return matcher_.match(HttpMethodToString(request.getMethod()), request.getPath());
}

auto createRouter(const std::string &baseDir, const RouterOptions &options,
                  std::shared_ptr<ModuleLoader> modules) -> std::unique_ptr<Router> {
    auto router = std::make_unique<Router>(baseDir, options, std::move(modules));
    router->initialize();
    return router;
}

} // namespace Bext
