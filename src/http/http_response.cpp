#include "http/http_response.hpp"
#include <stdexcept>

namespace Bext {

auto reasonPhraseFor(int statusCode) -> std::string {
    static const std::map<int, std::string> statusCodeMap{
        {200, "OK"},
        {201, "Created"},
        {204, "No Content"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {304, "Not Modified"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {409, "Conflict"},
        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"},
        {505, "HTTP Version Not Supported"},
    };
    auto it = statusCodeMap.find(statusCode);
    return it != statusCodeMap.end() ? it->second : "Unknown";
}

HttpResponse HttpResponse::stockResponse(int statusCode) {
    HttpResponse response;
    response.setVersion(HttpVersion::HTTP_1_1);
    response.setStatusCode(statusCode);
    return response;
}

void HttpResponse::setStatusCode(int statusCode) {
    this->statusCode = statusCode;
    this->reasonPhrase = reasonPhraseFor(statusCode);
}

void HttpResponse::addHeader(const std::string &key, const std::string &value,
                             bool overwrite) {
    if (!overwrite && headers.find(key) != headers.end()) {
        throw std::invalid_argument(
            "Header already exists and overwrite is disabled");
    }
    headers[key] = value;
}

auto HttpResponseSerializer::serialize(const HttpResponse &response) -> std::string {
    const auto &body = response.getBody();
    std::string out;
    out.reserve(64 + body.size());

    out += HttpVersionToString(response.getVersion());
    out += ' ';
    out += std::to_string(response.getStatusCode());
    out += ' ';
    out += response.getReasonPhrase();
    out += "\r\n";

    for (const auto &[key, value] : response.getHeaders()) {
        out += key;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    if (!response.hasHeader("Content-Length")) {
        out += "Content-Length: ";
        out += std::to_string(body.size());
        out += "\r\n";
    }
    out += "\r\n";
    out += body;
    return out;
}

} // namespace Bext
