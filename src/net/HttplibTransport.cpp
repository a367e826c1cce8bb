#include "net/HttplibTransport.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::unique_ptr<IHttpTransport> createHttpTransport() {
    return std::make_unique<HttplibTransport>();
}

std::pair<std::string, std::string> HttplibTransport::splitUrl(const std::string& url) {
    auto scheme = url.find("://");
    size_t hostStart = scheme == std::string::npos ? 0 : scheme + 3;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos)
        return {url, "/"};
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

HttpResponse HttplibTransport::send(const HttpRequest& request) {
    auto [origin, path] = splitUrl(request.url);

    httplib::Client cli(origin);
    cli.set_connection_timeout(request.timeoutMs / 1000,
                               (request.timeoutMs % 1000) * 1000);
    cli.set_read_timeout(request.timeoutMs / 1000,
                         (request.timeoutMs % 1000) * 1000);
    cli.set_follow_location(true);

    httplib::Headers headers;
    std::string contentType = "application/json";
    for (auto& [key, value] : request.headers) {
        if (equalsIgnoreCase(key, "Content-Type"))
            contentType = value;
        else
            headers.emplace(key, value);
    }

    httplib::Result res;
    if (request.method == "POST")
        res = cli.Post(path, headers, request.body, contentType);
    else if (request.method == "PUT")
        res = cli.Put(path, headers, request.body, contentType);
    else if (request.method == "DELETE")
        res = cli.Delete(path, headers);
    else
        res = cli.Get(path, headers);

    HttpResponse response;
    if (!res) {
        response.error = httplib::to_string(res.error());
        spdlog::debug("HTTP {} {} failed: {}", request.method, path, response.error);
        return response;
    }

    response.status = res->status;
    response.body   = res->body;
    for (auto& [key, value] : res->headers)
        response.headers[key] = value;

    spdlog::debug("HTTP {} {}{} -> {} ({} bytes)",
                  request.method, origin, path, response.status, response.body.size());
    return response;
}
