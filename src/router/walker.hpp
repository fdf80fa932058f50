#ifndef BEXT_ROUTER_WALKER_HPP
#define BEXT_ROUTER_WALKER_HPP

#include "router/matcher.hpp"
#include "router/types.hpp"
#include <string>
#include <vector>

namespace Bext {

/* Entries of `dir` in directory order; throws std::filesystem::filesystem_error */
auto readDirectory(const std::string &dir) -> std::vector<Dirent>;

/* Files first (index.* leading), then subdirectories, each group by name */
void sortDirents(std::vector<Dirent> &entries);

/*
 * Registers every route file under `dir`. Subdirectories extend `prefix` with
 * their name. A missing directory contributes no routes; any other failure
 * aborts the walk.
 */
void walk(const std::string &dir, const std::string &prefix, RouteMatcher &matcher);

} // namespace Bext

#endif
