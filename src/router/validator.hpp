#ifndef BEXT_ROUTER_VALIDATOR_HPP
#define BEXT_ROUTER_VALIDATOR_HPP

#include "errors.hpp"
#include "http/http_request.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Bext {

/* The part of a route that exists before its pattern is compiled */
struct RouteInput {
    std::vector<HttpMethod> methods;
    std::string path;
    std::string file;
};

/*
 * Throws RouteValidationError naming the offending field. Directory registration
 * does not call it; it checks routes assembled by hand.
 */
void validateRoute(const RouteInput &route);

struct ValidationResult {
    bool valid = true;
    std::optional<RouteValidationError> error;
};

auto validateRouteSafe(const RouteInput &route) -> ValidationResult;

} // namespace Bext

#endif
