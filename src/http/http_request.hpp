#ifndef BEXT_HTTP_REQUEST_HPP
#define BEXT_HTTP_REQUEST_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <string>

namespace Bext {

enum class HttpMethod { GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS, UNKNOWN };

/* Every method a route module may export, in canonical order */
inline constexpr std::array<HttpMethod, 7> kHttpMethods = {
    HttpMethod::GET,   HttpMethod::POST, HttpMethod::PUT,    HttpMethod::DELETE,
    HttpMethod::PATCH, HttpMethod::HEAD, HttpMethod::OPTIONS};

auto stringToHttpMethod(const std::string &method) -> HttpMethod;
auto HttpMethodToString(HttpMethod method) -> std::string;

enum class HttpVersion { HTTP_1_0, HTTP_1_1, UNKNOWN };

auto stringToHttpVersion(const std::string &version) -> HttpVersion;
auto HttpVersionToString(HttpVersion version) -> std::string;

struct CaseInsensitiveCompare {
    bool operator()(const std::string &a, const std::string &b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char ca, unsigned char cb) { return std::tolower(ca) < std::tolower(cb); });
    }
};

using HttpHeaderMap =
std::map<std::string, std::string, CaseInsensitiveCompare>;
using HttpUrl = std::string;
using HttpBody = std::string;
using HttpQueryMap = std::map<std::string, std::string>;

class HttpRequest {
public:
    friend struct HttpRequestParser;
    HttpRequest();
    explicit HttpRequest(const std::string &raw);
    HttpRequest(HttpMethod method, HttpUrl url, HttpHeaderMap headers = {}, HttpBody body = {});

    HttpMethod getMethod() const { return method; }
    const HttpUrl &getUrl() const { return url; }
    const HttpVersion &getVersion() const { return version; }
    const HttpHeaderMap &getHeaders() const { return headers; }
    const HttpBody &getBody() const { return body; }
    const HttpQueryMap &getQueryParams() const { return query_params; }

    // "/users/42" for both "/users/42?x=1" and "http://host/users/42#top"
    std::string getPath() const;

    void setMethod(HttpMethod method) { this->method = method; }
    void setUrl(HttpUrl url) {
        this->url = std::move(url);
        parseQueryParams();
    }
    void setVersion(HttpVersion version) { this->version = version; }
    void setHeaders(HttpHeaderMap headers) { this->headers = std::move(headers); }
    void setHeader(const std::string &key, const std::string &value) { headers[key] = value; }
    void setBody(HttpBody body) { this->body = std::move(body); }

    std::string getHeader(const std::string &key) const {
        auto it = headers.find(key);
        return it != headers.end() ? it->second : "";
    }
    std::string getQueryParam(const std::string &key) const {
        auto it = query_params.find(key);
        return it != query_params.end() ? it->second : "";
    }

private:
    HttpMethod method;
    HttpUrl url;
    HttpVersion version;
    HttpHeaderMap headers;
    HttpBody body;
    HttpQueryMap query_params;
    void parseQueryParams();
};

void trim(std::string &s);
std::string urlDecode(const std::string &str);

struct HttpRequestParser {
    static void parse(const std::string &raw, HttpRequest *request);
};

} // namespace Bext

#endif
