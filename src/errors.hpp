#ifndef BEXT_ERRORS_HPP
#define BEXT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Bext {

/* Route error codes */
namespace ErrorCode {
inline const std::string INVALID_ROUTE = "INVALID_ROUTE";
inline const std::string INVALID_METHOD = "INVALID_METHOD";
inline const std::string INVALID_METHODS = "INVALID_METHODS";
inline const std::string INVALID_PATH = "INVALID_PATH";
inline const std::string INVALID_PATTERN = "INVALID_PATTERN";
inline const std::string INVALID_HANDLER = "INVALID_HANDLER";
inline const std::string HANDLER_LOAD_ERROR = "HANDLER_LOAD_ERROR";
inline const std::string MODULE_LOAD_ERROR = "MODULE_LOAD_ERROR";
inline const std::string NOT_FOUND = "NOT_FOUND";

/* Validation codes */
inline const std::string PATH_MUST_START_WITH_SLASH = "PATH_MUST_START_WITH_SLASH";
inline const std::string INVALID_PATH_TRAVERSAL = "INVALID_PATH_TRAVERSAL";
inline const std::string INVALID_FILE = "INVALID_FILE";
inline const std::string INVALID_FILE_EXTENSION = "INVALID_FILE_EXTENSION";
inline const std::string FILE_NOT_FOUND = "FILE_NOT_FOUND";
inline const std::string UNKNOWN_ERROR = "UNKNOWN_ERROR";
} // namespace ErrorCode

class BextError : public std::runtime_error {
public:
    BextError(const std::string &message, std::string code = "", int status = 0)
        : std::runtime_error(message), code_(std::move(code)), status_(status) {}

    const std::string &code() const { return code_; }

    /* 0 when the error does not carry an HTTP status */
    int status() const { return status_; }

private:
    std::string code_;
    int status_;
};

class ServerError : public BextError {
public:
    ServerError(const std::string &message, int status = 500, std::string code = "")
        : BextError(message, std::move(code), status) {}
};

class RouteError : public BextError {
public:
    RouteError(const std::string &message, std::string code, int status = 0)
        : BextError(message, std::move(code), status) {}
};

class RouteValidationError : public BextError {
public:
    RouteValidationError(const std::string &message, std::string code, std::string field = "")
        : BextError(message, std::move(code)), field_(std::move(field)) {}

    const std::string &field() const { return field_; }

private:
    std::string field_;
};

auto describeError(const std::exception &e) -> std::string;

} // namespace Bext

#endif
