#ifndef BEXT_ROUTER_CONFIG_HPP
#define BEXT_ROUTER_CONFIG_HPP

#include <chrono>
#include <map>
#include <string>

namespace Bext {

inline constexpr std::chrono::milliseconds kDefaultCacheTtl{60000};

struct RouterOptions {
    bool cache = true;                               /* Enable the match cache */
    std::chrono::milliseconds cache_ttl = kDefaultCacheTtl;
    bool debug = false;                              /* DEBUG level logging */
    std::string prefix;                              /* Common path prefix, stripped before matching */

    RouterOptions& setCache(bool enabled) {
        this->cache = enabled;
        return *this;
    }

    RouterOptions& setCacheTtl(std::chrono::milliseconds ttl) {
        this->cache_ttl = ttl;
        return *this;
    }

    RouterOptions& setDebug(bool enabled) {
        this->debug = enabled;
        return *this;
    }

    RouterOptions& setPrefix(const std::string& prefix) {
        this->prefix = prefix;
        return *this;
    }
};

struct EngineConfig {
    std::string routes_dir = "app/api";              /* Relative paths resolve against the cwd */
    RouterOptions router;
    std::map<std::string, std::string> env;          /* Exposed to handlers through Context::env */

    EngineConfig() = default;

    explicit EngineConfig(std::string routes_dir) : routes_dir(std::move(routes_dir)) {}

    EngineConfig& setRoutesDir(const std::string& dir) {
        this->routes_dir = dir;
        return *this;
    }

    EngineConfig& setPrefix(const std::string& prefix) {
        this->router.setPrefix(prefix);
        return *this;
    }

    EngineConfig& setCache(bool enabled, std::chrono::milliseconds ttl = kDefaultCacheTtl) {
        this->router.setCache(enabled).setCacheTtl(ttl);
        return *this;
    }

    EngineConfig& setDebug(bool enabled) {
        this->router.setDebug(enabled);
        return *this;
    }

    EngineConfig& setEnv(const std::string& key, const std::string& value) {
        this->env[key] = value;
        return *this;
    }
};

} /* namespace Bext */

#endif
