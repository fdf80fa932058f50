#ifndef BEXT_ROUTER_REGISTRY_HPP
#define BEXT_ROUTER_REGISTRY_HPP

#include "router/matcher.hpp"
#include <string>

namespace Bext {

/* "/" or "/prefix/" for index files, "/prefix[id]" for dynamic names, "/prefix/name" otherwise */
auto buildRoutePath(const std::string &prefix, const std::string &name, bool isIndex) -> std::string;

/*
 * Collapses repeated '/' outside "[...]" segments, guarantees a leading '/'
 * and puts a '/' in front of every '[' that lacks one.
 */
auto normalizeRoutePath(const std::string &routePath) -> std::string;

/* Loads and compiles one route file and adds it to `matcher` */
void registerRouteFile(RouteMatcher &matcher, const std::string &filename,
                       const std::string &fullPath, const std::string &prefix);

} // namespace Bext

#endif
