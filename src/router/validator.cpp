#include "router/validator.hpp"
#include "router/parser.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unistd.h>

namespace Bext {

namespace {

void validateMethods(const std::vector<HttpMethod> &methods) {
    if (methods.empty()) {
        throw RouteValidationError("Route methods must be a non-empty array",
                                   ErrorCode::INVALID_METHODS, "methods");
    }
    for (HttpMethod method : methods) {
        if (std::find(kHttpMethods.begin(), kHttpMethods.end(), method) == kHttpMethods.end()) {
            throw RouteValidationError(
                "Invalid HTTP method: " + HttpMethodToString(method) +
                    ". Must be one of: GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS",
                ErrorCode::INVALID_METHOD, "methods");
        }
    }
}

void validatePath(const std::string &path) {
    bool blank = std::all_of(path.begin(), path.end(),
                             [](unsigned char ch) { return std::isspace(ch); });
    if (blank) {
        throw RouteValidationError("Route path must be a non-empty string",
                                   ErrorCode::INVALID_PATH, "path");
    }
    if (path[0] != '/') {
        throw RouteValidationError("Route path must start with '/': " + path,
                                   ErrorCode::PATH_MUST_START_WITH_SLASH, "path");
    }
    if (path.find("..") != std::string::npos || path.find("//") != std::string::npos) {
        throw RouteValidationError("Invalid path: " + path + ". Path traversal is not allowed",
                                   ErrorCode::INVALID_PATH_TRAVERSAL, "path");
    }
}

void validateFile(const std::string &file) {
    bool blank = std::all_of(file.begin(), file.end(),
                             [](unsigned char ch) { return std::isspace(ch); });
    if (blank) {
        throw RouteValidationError("Route file must be a non-empty string",
                                   ErrorCode::INVALID_FILE, "file");
    }

    std::string ext = std::filesystem::path(file).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (kRouteFileExtensions.count(ext) == 0) {
        throw RouteValidationError("Route file must be a shared object: " + file,
                                   ErrorCode::INVALID_FILE_EXTENSION, "file");
    }

    if (::access(file.c_str(), R_OK) != 0) {
        throw RouteValidationError("Route file not found or not readable: " + file,
                                   ErrorCode::FILE_NOT_FOUND, "file");
    }
}

} // namespace

void validateRoute(const RouteInput &route) {
    validateMethods(route.methods);
    validatePath(route.path);
    validateFile(route.file);
}

auto validateRouteSafe(const RouteInput &route) -> ValidationResult {
    try {
        validateRoute(route);
        return ValidationResult{};
    } catch (const RouteValidationError &e) {
        return ValidationResult{false, e};
    } catch (const std::exception &e) {
        return ValidationResult{false, RouteValidationError(e.what(), ErrorCode::UNKNOWN_ERROR)};
    }
}

} // namespace Bext
