#include <cassert>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>
#include "engine.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "test_support.hpp"

using Bext::HttpMethod;

namespace {

std::shared_ptr<Bext::StaticModuleLoader> makeApp(const BextTest::TempDir &dir) {
    auto loader = std::make_shared<Bext::StaticModuleLoader>();
    loader->define(dir.touch("hello.so"),
                   {{"GET", [](Bext::Context &ctx) { ctx.json({{"message", "Hello, World!"}}); }}});
    loader->define(dir.touch("users/[id].so"),
                   {{"GET", [](Bext::Context &ctx) {
                         ctx.json({{"id", ctx.param("id")}, {"stage", ctx.env("STAGE")}});
                     }},
                    {"DELETE", [](Bext::Context &) {}},
                    {"PUT", [](Bext::Context &ctx) { ctx.status(202).string("queued"); }}});
    loader->define(dir.touch("fail.so"),
                   {{"GET", [](Bext::Context &) { throw std::runtime_error("database offline"); }},
                    {"POST", [](Bext::Context &) {
                         throw Bext::ServerError("Payment Required", 402, "PAYMENT");
                     }}});
    return loader;
}

Bext::EngineConfig configFor(const BextTest::TempDir &dir) {
    Bext::EngineConfig config(dir.path().string());
    config.setPrefix("/api").setEnv("STAGE", "test");
    return config;
}

bool isRequestId(const std::string &id) {
    if (id.size() != 16) {
        return false;
    }
    for (unsigned char c : id) {
        if (!std::isxdigit(c) || std::isupper(c)) {
            return false;
        }
    }
    return true;
}

} // namespace

void test_json_response() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));
    assert(engine.routes().size() == 3);

    auto response = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/hello"));
    assert(response.getStatusCode() == 200);
    assert(response.getHeader("Content-Type") == "application/json");
    assert(nlohmann::json::parse(response.getBody())["message"] == "Hello, World!");
    assert(isRequestId(response.getHeader("X-Request-ID")));

    auto user = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/users/42"));
    auto body = nlohmann::json::parse(user.getBody());
    assert(body["id"] == "42");
    assert(body["stage"] == "test");
}

void test_not_found() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));

    auto missing = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/nothing"));
    assert(missing.getStatusCode() == 404);
    assert(missing.getBody() == "Not Found");
    assert(missing.getHeader("Content-Type") == "application/json");
    assert(isRequestId(missing.getHeader("X-Request-ID")));

    /* Outside the prefix */
    auto outside = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/hello"));
    assert(outside.getStatusCode() == 404);

    /* Unregistered method */
    auto wrong_method = engine.handle(Bext::HttpRequest(HttpMethod::POST, "/api/hello"));
    assert(wrong_method.getStatusCode() == 404);
}

void test_no_content() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));

    auto response = engine.handle(Bext::HttpRequest(HttpMethod::DELETE, "/api/users/1"));
    assert(response.getStatusCode() == 204);
    assert(response.getReasonPhrase() == "No Content");
    assert(response.getBody().empty());

    auto queued = engine.handle(Bext::HttpRequest(HttpMethod::PUT, "/api/users/1"));
    assert(queued.getStatusCode() == 202);
    assert(queued.getBody() == "queued");
    assert(queued.getHeader("Content-Type") == "text/plain; charset=utf-8");
}

void test_handler_errors() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));

    auto crashed = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/fail"));
    assert(crashed.getStatusCode() == 500);
    assert(crashed.getBody() == "database offline");
    assert(isRequestId(crashed.getHeader("X-Request-ID")));

    auto declined = engine.handle(Bext::HttpRequest(HttpMethod::POST, "/api/fail"));
    assert(declined.getStatusCode() == 402);
    assert(declined.getBody() == "Payment Required");
}

void test_long_url() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));

    const std::string id(120000, '7');
    auto response = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/users/" + id));
    assert(response.getStatusCode() == 200);
    assert(nlohmann::json::parse(response.getBody())["id"] == id);

    auto missing = engine.handle(Bext::HttpRequest(HttpMethod::GET, "/api/" + id + "/x"));
    assert(missing.getStatusCode() == 404);
}

void test_parsed_request() {
    BextTest::TempDir dir;
    Bext::Engine engine(configFor(dir), makeApp(dir));

    Bext::HttpRequest request("GET /api/users/7?verbose=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
    auto response = engine.handle(request);
    assert(response.getStatusCode() == 200);

    std::string wire = Bext::HttpResponseSerializer::serialize(response);
    assert(wire.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(wire.find("X-Request-ID: ") != std::string::npos);
}

void test_startup_errors_propagate() {
    BextTest::TempDir dir;
    auto loader = std::make_shared<Bext::StaticModuleLoader>();
    dir.touch("undefined.so");

    bool failed = BextTest::throwsWith<Bext::RouteError>(
        [&] { Bext::Engine engine(Bext::EngineConfig(dir.path().string()), loader); },
        [](const Bext::RouteError &e) { return e.code() == Bext::ErrorCode::MODULE_LOAD_ERROR; });
    assert(failed);
}

void test_request_ids() {
    std::string first = Bext::Engine::generateRequestId();
    std::string second = Bext::Engine::generateRequestId();
    assert(isRequestId(first));
    assert(isRequestId(second));
    assert(first != second);
}

int main() {
    Bext::defaultLogger().set_log_level(Bext::LogLevel::OFF);

    test_json_response();
    test_not_found();
    test_no_content();
    test_handler_errors();
    test_long_url();
    test_parsed_request();
    test_startup_errors_propagate();
    test_request_ids();

    std::cout << "all engine tests passed" << std::endl;
    return 0;
}
