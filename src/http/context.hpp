#ifndef BEXT_CONTEXT_HPP
#define BEXT_CONTEXT_HPP

#include "http/http_request.hpp"
#include "http/http_response.hpp"
#include "router/route_params.hpp"
#include <any>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <stdexcept>
#include <string>

namespace Bext {

using EnvMap = std::map<std::string, std::string>;

class Context {
public:
    explicit Context(const HttpRequest &req, RouteParams params = {}, EnvMap env = {})
    : request_(req), response_(HttpResponse::stockResponse(200)),
      router_params_(std::move(params)), env_(std::move(env)) {}

    const HttpRequest &request() const { return request_; }

    // get router params, empty string when absent
    const std::string &param(const std::string &key) const;
    const RouteParams &params() const { return router_params_; }
    void setParams(RouteParams params) { router_params_ = std::move(params); }

    // get query params
    std::string query(const std::string &key) const;

    std::string header(const std::string &key) const;

    std::string env(const std::string &key, const std::string &fallback = "") const;

    void set(const std::string &key, const std::any &value);

    template <typename T> T get(const std::string &key) const {
        std::shared_lock<std::shared_mutex> lock(context_data_mutex_);
        auto it = context_data_.find(key);
        if (it != context_data_.end()) {
            try {
                return std::any_cast<T>(it->second);
            } catch (const std::bad_any_cast &) {
                throw std::runtime_error("Context data type mismatch for key: " + key);
            }
        }
        throw std::runtime_error("Context data not found for key: " + key);
    }

    bool has(const std::string &key) const;

    HttpResponse &response();

    Context &status(int code);

    void json(const nlohmann::json &data);

    void string(const std::string &data);

    void html(const std::string &html);

    /* null -> 204 without body, object/array -> JSON, string -> text, other scalars -> their JSON text */
    void send(const nlohmann::json &data);

    Context &header(const std::string &key, const std::string &value);

    /* True once the handler set a status or a body */
    bool written() const { return written_; }

private:
    const HttpRequest &request_;
    HttpResponse response_;
    RouteParams router_params_;
    EnvMap env_;
    bool written_ = false;
    mutable std::shared_mutex context_data_mutex_;
    std::map<std::string, std::any> context_data_;
};

/* A route handler as exported by a route module */
using RouteHandler = std::function<void(Context &)>;

} // namespace Bext

#endif
