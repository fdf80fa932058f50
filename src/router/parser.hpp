#ifndef BEXT_ROUTER_PARSER_HPP
#define BEXT_ROUTER_PARSER_HPP

#include "router/module_loader.hpp"
#include "router/types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Bext {

// Route modules are shared objects; interface stubs next to them are skipped.
inline const std::set<std::string> kRouteFileExtensions = {".so"};
inline const std::string kRouteStubSuffix = ".stub.so";

struct ParsedFileName {
    std::string name;                 // "" for index, "[id]" for dynamic segments
    std::vector<HttpMethod> methods;  // placeholder, the module's exports decide
    bool is_index = false;
};

auto isRouteFile(const std::string &filename) -> bool;

auto parseFileName(const std::string &filename) -> ParsedFileName;

/*
 * Compiles a route template. "[name]" and ":name" segments become parameters;
 * everything else matches literally; a trailing '/' is optional. Throws
 * RouteError(INVALID_PATTERN) for an empty template.
 * Results are memoized per template, so equal inputs return the same pointer.
 */
auto compileRoutePattern(const std::string &routePath) -> std::shared_ptr<const CompiledPattern>;

/* One captured value per key when `path` matches, std::nullopt otherwise */
auto matchRoutePattern(const CompiledPattern &pattern, const std::string &path)
    -> std::optional<std::vector<std::string>>;

/* Methods exported by the module at `file`; throws RouteError(MODULE_LOAD_ERROR) if none */
auto loadRouteMethods(ModuleLoader &loader, const std::string &file) -> std::vector<HttpMethod>;

} // namespace Bext

#endif
