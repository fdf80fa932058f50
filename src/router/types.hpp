#ifndef BEXT_ROUTER_TYPES_HPP
#define BEXT_ROUTER_TYPES_HPP

#include "http/context.hpp"
#include "http/http_request.hpp"
#include "router/module_loader.hpp"
#include "router/route_params.hpp"
#include <any>
#include <memory>
#include <string>
#include <vector>

namespace Bext {

struct PatternToken {
    enum class Kind { LITERAL, PARAM };

    Kind kind = Kind::LITERAL;
    std::string text;  // literal text, or the key name of a parameter
    int slot = -1;     // index into keys; -1 for a parameter that does not capture
};

/*
 * A route template split into literal and parameter tokens. A parameter matches
 * one or more characters other than '/'; the whole path must be consumed, save
 * for one optional trailing '/'.
 */
struct CompiledPattern {
    std::string source;             // template the pattern was compiled from
    std::vector<PatternToken> tokens;
    std::vector<std::string> keys;  // one per capturing parameter, left to right
};

struct Route {
    std::vector<HttpMethod> methods;
    std::string path;
    std::string file;
    std::shared_ptr<const CompiledPattern> pattern;
    std::vector<std::string> keys;
};

/* Directory entry seen by the walker; link targets are not followed */
struct Dirent {
    std::string name;
    std::string path;
    bool is_file = false;
    bool is_directory = false;
    bool is_symbolic_link = false;
};

/*
 * Deferred access to a route's handler: the route descriptor plus the loader
 * that can import its module. Nothing is loaded until load() is called.
 */
class HandlerLoader {
public:
    HandlerLoader(std::shared_ptr<const Route> route, std::shared_ptr<ModuleLoader> modules)
        : route_(std::move(route)), modules_(std::move(modules)) {}

    const Route &route() const { return *route_; }

    // Imports the module and returns a dispatcher that picks the export for the
    // request method at call time, then the DEFAULT export.
    RouteHandler load() const;

private:
    std::shared_ptr<const Route> route_;
    std::shared_ptr<ModuleLoader> modules_;
};

struct RouteMatch {
    RouteParams params;
    HandlerLoader loader;
    std::any meta;

    RouteHandler load() const { return loader.load(); }
};

} // namespace Bext

#endif
