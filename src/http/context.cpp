#include "http/context.hpp"

namespace Bext {

auto Context::param(const std::string &key) const -> const std::string & {
    static const std::string empty;
    const std::string *value = router_params_.find(key);
    return value != nullptr ? *value : empty;
}

std::string Context::query(const std::string &key) const {
    return request_.getQueryParam(key);
}

std::string Context::header(const std::string &key) const {
    return request_.getHeader(key);
}

std::string Context::env(const std::string &key, const std::string &fallback) const {
    auto it = env_.find(key);
    return it != env_.end() ? it->second : fallback;
}

void Context::set(const std::string &key, const std::any &value) {
    std::lock_guard<std::shared_mutex> lock(context_data_mutex_);
    context_data_[key] = value;
}

bool Context::has(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(context_data_mutex_);
    return context_data_.find(key) != context_data_.end();
}

HttpResponse &Context::response() {
    return response_;
}

Context &Context::status(int code) {
    response_.setStatusCode(code);
    written_ = true;
    return *this;
}

void Context::json(const nlohmann::json &data) {
    response_.addHeader("Content-Type", "application/json");
    response_.setBody(data.dump());
    written_ = true;
}

void Context::string(const std::string &data) {
    response_.addHeader("Content-Type", "text/plain; charset=utf-8");
    response_.setBody(data);
    written_ = true;
}

void Context::html(const std::string &html) {
    response_.addHeader("Content-Type", "text/html; charset=utf-8");
    response_.setBody(html);
    written_ = true;
}

void Context::send(const nlohmann::json &data) {
    if (data.is_null()) {
        status(204);
        response_.setBody("");
        return;
    }
    if (data.is_object() || data.is_array()) {
        json(data);
        return;
    }
    if (data.is_string()) {
        string(data.get<std::string>());
        return;
    }
    string(data.dump());
}

Context &Context::header(const std::string &key, const std::string &value) {
    response_.addHeader(key, value);
    return *this;
}

} // namespace Bext
