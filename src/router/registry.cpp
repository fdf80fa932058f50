#include "router/registry.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "router/parser.hpp"

namespace Bext {

namespace {

std::string joinMethods(const std::vector<HttpMethod> &methods) {
    std::string out;
    for (HttpMethod method : methods) {
        if (!out.empty()) {
            out += ", ";
        }
        out += HttpMethodToString(method);
    }
    return out;
}

} // namespace

auto buildRoutePath(const std::string &prefix, const std::string &name, bool isIndex) -> std::string {
    if (isIndex) {
        return prefix.empty() ? "/" : "/" + prefix + "/";
    }
    if (name.size() >= 2 && name.front() == '[' && name.back() == ']') {
        return prefix.empty() ? "/" + name : "/" + prefix + name;
    }
    return prefix.empty() ? "/" + name : "/" + prefix + "/" + name;
}

auto normalizeRoutePath(const std::string &routePath) -> std::string {
    std::string out;
    out.reserve(routePath.size() + 4);
    int depth = 0;

    for (char c : routePath) {
        if (c == '[') {
            if (!out.empty() && out.back() != '/') {
                out.push_back('/');
            }
            depth++;
        } else if (c == ']' && depth > 0) {
            depth--;
        } else if (c == '/' && depth == 0 && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }

    if (out.empty() || out[0] != '/') {
        out.insert(out.begin(), '/');
    }
    return out;
}

void registerRouteFile(RouteMatcher &matcher, const std::string &filename,
                       const std::string &fullPath, const std::string &prefix) {
    const ParsedFileName parsed = parseFileName(filename);

    const std::vector<HttpMethod> methods = loadRouteMethods(matcher.modules(), fullPath);

    const std::string routePath = normalizeRoutePath(buildRoutePath(prefix, parsed.name, parsed.is_index));

    try {
        // the pattern ignores a trailing '/', except for the root itself
        std::string patternPath = routePath;
        if (patternPath.size() > 1 && patternPath.back() == '/') {
            patternPath.pop_back();
        }
        auto compiled = compileRoutePattern(patternPath);

        Route route;
        route.methods = methods;
        route.path = routePath;
        route.file = fullPath;
        route.pattern = compiled;
        route.keys = compiled->keys;
        matcher.add(std::move(route));

        defaultLogger().debug("Registered route " + joinMethods(methods) + " " + routePath +
                              " -> " + fullPath);
    } catch (const std::exception &e) {
        defaultLogger().error("Failed to register route " + joinMethods(methods) + " " +
                              routePath + ": " + describeError(e));
        throw;
    }
}

} // namespace Bext
