#include "http/http_request.hpp"
#include <sstream>
#include <stdexcept>

namespace Bext {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string urlDecode(const std::string &str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.length(); ++i) {
        if (str[i] == '%' && i + 2 < str.length()) {
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
            } else {
                result += str[i];
            }
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

auto stringToHttpMethod(const std::string &method) -> HttpMethod {
    static const std::map<std::string, HttpMethod> methods = {
        {"GET", HttpMethod::GET},
        {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},
        {"DELETE", HttpMethod::DELETE},
        {"PATCH", HttpMethod::PATCH},
        {"HEAD", HttpMethod::HEAD},
        {"OPTIONS", HttpMethod::OPTIONS}};
    auto it = methods.find(method);
    return it != methods.end() ? it->second : HttpMethod::UNKNOWN;
}

auto HttpMethodToString(HttpMethod method) -> std::string {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

auto stringToHttpVersion(const std::string &version) -> HttpVersion {
    if (version == "HTTP/1.0") return HttpVersion::HTTP_1_0;
    if (version == "HTTP/1.1") return HttpVersion::HTTP_1_1;
    return HttpVersion::UNKNOWN;
}

auto HttpVersionToString(HttpVersion version) -> std::string {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "UNKNOWN";
    }
}

HttpRequest::HttpRequest()
: method(HttpMethod::UNKNOWN), version(HttpVersion::UNKNOWN) {}

HttpRequest::HttpRequest(const std::string &raw) : HttpRequest() {
    HttpRequestParser::parse(raw, this);
}

HttpRequest::HttpRequest(HttpMethod method, HttpUrl url, HttpHeaderMap headers, HttpBody body)
    : method(method), url(std::move(url)), version(HttpVersion::HTTP_1_1),
      headers(std::move(headers)), body(std::move(body)) {
    parseQueryParams();
}

std::string HttpRequest::getPath() const {
    std::string path = url;

    // absolute-form: scheme://authority/path
    size_t scheme_end = path.find("://");
    size_t first_query = path.find_first_of("?#");
    if (scheme_end != std::string::npos && scheme_end < first_query) {
        size_t path_start = path.find_first_of("/?#", scheme_end + 3);
        path = path_start == std::string::npos ? "" : path.substr(path_start);
    }

    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    if (path.empty() || path[0] != '/') {
        path.insert(path.begin(), '/');
    }
    return path;
}

void HttpRequest::parseQueryParams() {
    query_params.clear();
    size_t query_start = url.find('?');
    if (query_start == std::string::npos) {
        return;
    }
    size_t query_end = url.find('#', query_start);
    std::string query_string = url.substr(query_start + 1,
        query_end == std::string::npos ? std::string::npos : query_end - query_start - 1);
    std::stringstream ss(query_string);
    std::string param;
    while (std::getline(ss, param, '&')) {
        if (param.empty()) continue;
        size_t eq_pos = param.find('=');
        if (eq_pos == std::string::npos) {
            query_params[urlDecode(param)] = "";
        } else {
            query_params[urlDecode(param.substr(0, eq_pos))] = urlDecode(param.substr(eq_pos + 1));
        }
    }
}

void trim(std::string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char ch) { return !std::isspace(ch); })
            .base(),
            s.end());
}

void HttpRequestParser::parse(const std::string &raw, HttpRequest *httpRequest) {
    if (!httpRequest) {
        throw std::invalid_argument("HttpRequest is null");
    }
    const std::string crlf = "\r\n";
    const std::string double_crlf = "\r\n\r\n";

    size_t request_line_end = raw.find(crlf);
    if (request_line_end == std::string::npos) {
        throw std::invalid_argument("request line not found");
    }
    std::stringstream request_line_stream(raw.substr(0, request_line_end));
    std::string method_str, url_str, version_str;
    request_line_stream >> method_str >> url_str >> version_str;

    if (method_str.empty() || url_str.empty() || version_str.empty()) {
        throw std::invalid_argument("request line is invalid");
    }
    std::transform(method_str.begin(), method_str.end(), method_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    httpRequest->method = stringToHttpMethod(method_str);
    httpRequest->url = url_str;
    httpRequest->parseQueryParams();
    httpRequest->version = stringToHttpVersion(version_str);

    size_t headers_start = request_line_end + crlf.length();
    size_t headers_end = raw.find(double_crlf, request_line_end);
    if (headers_end == std::string::npos) {
        throw std::invalid_argument("headers not found");
    }
    HttpHeaderMap headers;
    if (headers_end > headers_start) {
        std::stringstream headers_stream(raw.substr(headers_start, headers_end - headers_start));
        std::string header_line;
        while (std::getline(headers_stream, header_line)) {
            if (!header_line.empty() && header_line.back() == '\r') {
                header_line.pop_back();
            }
            if (header_line.empty()) {
                continue;
            }
            size_t colon_pos = header_line.find(':');
            if (colon_pos == std::string::npos) {
                throw std::invalid_argument("header line is invalid");
            }
            std::string key = header_line.substr(0, colon_pos);
            std::string value = header_line.substr(colon_pos + 1);
            trim(key);
            trim(value);
            headers[key] = value;
        }
    }

    size_t body_start = headers_end + double_crlf.length();
    httpRequest->body.clear();
    auto it = headers.find("Content-Length");
    if (it != headers.end()) {
        size_t content_length = 0;
        try {
            content_length = std::stoul(it->second);
        } catch (const std::exception &) {
            throw std::runtime_error("Content-Length is invalid");
        }
        if (raw.length() < body_start + content_length) {
            throw std::runtime_error("Actual body length is less than expected");
        }
        httpRequest->body = raw.substr(body_start, content_length);
    }
    httpRequest->headers = std::move(headers);
}

} // namespace Bext
