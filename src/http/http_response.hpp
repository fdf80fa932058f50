#ifndef BEXT_HTTP_RESPONSE_HPP
#define BEXT_HTTP_RESPONSE_HPP

#include "http/http_request.hpp"
#include <map>
#include <string>

namespace Bext {

auto reasonPhraseFor(int statusCode) -> std::string;

class HttpResponse {
public:
    HttpResponse() = default;

    static auto stockResponse(int statusCode) -> HttpResponse;

    void setVersion(HttpVersion version) { this->version = version; }
    void setStatusCode(int statusCode);
    void setReasonPhrase(std::string reasonPhrase) {
        this->reasonPhrase = std::move(reasonPhrase);
    }
    void setBody(HttpBody body) { this->body = std::move(body); }
    void addHeader(const std::string &key, const std::string &value,
                   bool overwrite = true);
    bool hasHeader(const std::string &key) const { return headers.count(key) != 0; }
    std::string getHeader(const std::string &key) const {
        auto it = headers.find(key);
        return it != headers.end() ? it->second : "";
    }

    HttpVersion getVersion() const { return version; }
    int getStatusCode() const { return statusCode; }
    const std::string &getReasonPhrase() const { return reasonPhrase; }
    const HttpHeaderMap &getHeaders() const { return headers; }
    const HttpBody &getBody() const { return body; }

private:
    HttpVersion version = HttpVersion::HTTP_1_1;
    int statusCode = 200;
    std::string reasonPhrase = "OK";
    HttpHeaderMap headers;
    HttpBody body;
};

struct HttpResponseSerializer {
    /* Status line, headers (Content-Length added when missing), blank line, body */
    static auto serialize(const HttpResponse &response) -> std::string;
};

} // namespace Bext

#endif
