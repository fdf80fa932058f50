#include "engine.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace Bext {

namespace {

HttpResponse errorResponse(int status, const std::string &message) {
    auto response = HttpResponse::stockResponse(status);
    response.addHeader("Content-Type", "application/json");
    response.setBody(message);
    return response;
}

} // namespace

Engine::Engine(const EngineConfig &config, std::shared_ptr<ModuleLoader> modules)
    : config_(config),
      router_(createRouter(config.routes_dir, config.router, std::move(modules))) {
}

std::string Engine::generateRequestId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << dist(rng);
    return oss.str();
}

HttpResponse Engine::handle(const HttpRequest &request) {
    const auto start = std::chrono::steady_clock::now();
    const std::string request_id = generateRequestId();
    const std::string request_line = "[" + request_id + "] " +
        HttpMethodToString(request.getMethod()) + " " + request.getUrl();

    defaultLogger().info(request_line);

    HttpResponse response;
    try {
        auto match = router_->match(request);
        if (!match) {
            throw ServerError("Not Found", 404, ErrorCode::NOT_FOUND);
        }

        Context ctx(request, match->params, config_.env);
        RouteHandler handler = match->load();
        if (!handler) {
            throw ServerError("Invalid route handler", 500, ErrorCode::INVALID_HANDLER);
        }
        handler(ctx);

        response = std::move(ctx.response());
        if (!ctx.written()) {
            response.setStatusCode(204);
            response.setBody("");
        }
        if (!response.hasHeader("Content-Type")) {
            response.addHeader("Content-Type", "application/json");
        }
    } catch (const BextError &e) {
        const int status = e.status() > 0 ? e.status() : 500;
        response = errorResponse(status, e.what());
        defaultLogger().error(request_line + " " + std::to_string(status) + " " + describeError(e));
    } catch (const std::exception &e) {
        response = errorResponse(500, e.what());
        defaultLogger().error(request_line + " 500 " + e.what());
    }

    response.addHeader("X-Request-ID", request_id);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    defaultLogger().info(request_line + " " + std::to_string(response.getStatusCode()) + " " +
                         std::to_string(elapsed.count()) + "ms");
    return response;
}

} // namespace Bext
