#ifndef BEXT_ENGINE_HPP
#define BEXT_ENGINE_HPP

#include "http/context.hpp"
#include "http/http_request.hpp"
#include "http/http_response.hpp"
#include "router.hpp"
#include "router_config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Bext {

/*
 * Request boundary for the transport: turns a parsed request into a response.
 * Route loading errors surface from the constructor; request-time errors are
 * converted to HTTP error responses and never escape handle().
 */
class Engine {
public:
    explicit Engine(const EngineConfig &config = EngineConfig(),
                    std::shared_ptr<ModuleLoader> modules = nullptr);

    HttpResponse handle(const HttpRequest &request);

    auto routes() const -> std::vector<std::shared_ptr<const Route>> { return router_->routes(); }

    Router &router() { return *router_; }
    const EngineConfig &config() const { return config_; }

    static std::string generateRequestId();

private:
    EngineConfig config_;
    std::unique_ptr<Router> router_;
};

} // namespace Bext

#endif
