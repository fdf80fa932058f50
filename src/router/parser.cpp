#include "router/parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <unordered_map>

namespace Bext {

namespace {

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::mutex pattern_cache_mutex;
std::unordered_map<std::string, std::shared_ptr<const CompiledPattern>> pattern_cache;

void appendLiteral(std::vector<PatternToken> &tokens, char c) {
    if (tokens.empty() || tokens.back().kind != PatternToken::Kind::LITERAL) {
        tokens.push_back(PatternToken{});
    }
    tokens.back().text.push_back(c);
}

auto buildPattern(const std::string &routePath) -> std::shared_ptr<const CompiledPattern> {
    if (routePath.empty()) {
        throw RouteError("Invalid route pattern: template is empty", ErrorCode::INVALID_PATTERN);
    }

    auto compiled = std::make_shared<CompiledPattern>();
    compiled->source = routePath;
    auto &keys = compiled->keys;

    const size_t n = routePath.size();
    for (size_t i = 0; i < n; i++) {
        const char c = routePath[i];

        if (c == '[') {
            size_t close = routePath.find(']', i + 1);
            if (close != std::string::npos && close > i + 1) {
                // bracket keys are recorded as-is, repeated names included
                PatternToken param{PatternToken::Kind::PARAM, routePath.substr(i + 1, close - i - 1),
                                   static_cast<int>(keys.size())};
                keys.push_back(param.text);
                compiled->tokens.push_back(std::move(param));
                i = close;
                continue;
            }
        }

        if (c == ':') {
            size_t end = i + 1;
            while (end < n && routePath[end] != '/') {
                end++;
            }
            if (end > i + 1) {
                PatternToken param{PatternToken::Kind::PARAM, routePath.substr(i + 1, end - i - 1)};
                if (std::find(keys.begin(), keys.end(), param.text) == keys.end()) {
                    param.slot = static_cast<int>(keys.size());
                    keys.push_back(param.text);
                }
                compiled->tokens.push_back(std::move(param));
                i = end - 1;
                continue;
            }
        }

        appendLiteral(compiled->tokens, c);
    }
    return compiled;
}

/*
 * Matches tokens[index..] against path[pos..]. Parameters take the longest
 * candidate first and give back characters on failure. Recursion depth is
 * bounded by the token count, never by the path length.
 */
bool matchTokens(const std::vector<PatternToken> &tokens, size_t index, const std::string &path,
                 size_t pos, std::vector<std::string> &captures) {
    if (index == tokens.size()) {
        return pos == path.size() || (pos + 1 == path.size() && path[pos] == '/');
    }

    const PatternToken &token = tokens[index];
    if (token.kind == PatternToken::Kind::LITERAL) {
        if (path.compare(pos, token.text.size(), token.text) != 0) {
            return false;
        }
        return matchTokens(tokens, index + 1, path, pos + token.text.size(), captures);
    }

    size_t segment_end = path.find('/', pos);
    if (segment_end == std::string::npos) {
        segment_end = path.size();
    }
    for (size_t end = segment_end; end > pos; end--) {
        if (matchTokens(tokens, index + 1, path, end, captures)) {
            if (token.slot >= 0) {
                captures[token.slot] = path.substr(pos, end - pos);
            }
            return true;
        }
    }
    return false;
}

} // namespace

auto isRouteFile(const std::string &filename) -> bool {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (kRouteFileExtensions.count(ext) == 0) {
        return false;
    }
    return !endsWith(filename, kRouteStubSuffix);
}

auto parseFileName(const std::string &filename) -> ParsedFileName {
    const std::string baseName = std::filesystem::path(filename).stem().string();

    ParsedFileName parsed;
    parsed.methods = {HttpMethod::GET};

    if (baseName == "index") {
        parsed.is_index = true;
        return parsed;
    }

    // "[id]" keeps its brackets and marks a dynamic segment
    parsed.name = baseName;
    return parsed;
}

auto compileRoutePattern(const std::string &routePath) -> std::shared_ptr<const CompiledPattern> {
    std::lock_guard<std::mutex> lock(pattern_cache_mutex);
    auto it = pattern_cache.find(routePath);
    if (it != pattern_cache.end()) {
        return it->second;
    }
    auto compiled = buildPattern(routePath);
    pattern_cache.emplace(routePath, compiled);
    return compiled;
}

auto matchRoutePattern(const CompiledPattern &pattern, const std::string &path)
    -> std::optional<std::vector<std::string>> {
    std::vector<std::string> captures(pattern.keys.size());
    if (!matchTokens(pattern.tokens, 0, path, 0, captures)) {
        return std::nullopt;
    }
    return captures;
}

auto loadRouteMethods(ModuleLoader &loader, const std::string &file) -> std::vector<HttpMethod> {
    std::shared_ptr<const RouteModule> module;
    try {
        module = loader.load(file);
    } catch (const std::exception &e) {
        defaultLogger().warn("Failed to load route module " + file + ": " + e.what());
        throw RouteError("Failed to load route module " + file + ": " + e.what(),
                         ErrorCode::MODULE_LOAD_ERROR);
    }

    auto methods = module->exportedMethods();
    if (methods.empty()) {
        throw RouteError("Route file must export at least one HTTP method "
                         "(GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS): " + file,
                         ErrorCode::MODULE_LOAD_ERROR);
    }
    return methods;
}

} // namespace Bext
