#pragma once
#include <map>
#include <memory>
#include <string>

struct HttpRequest {
    std::string method = "GET";
    std::string url;                              // absolute https://host/path?query
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 15000;
};

struct HttpResponse {
    int status = 0;                               // 0 = no response received
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;                            // transport failure detail
};

// Abstract interface: one HTTP round trip, no retries, no auth logic
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

std::unique_ptr<IHttpTransport> createHttpTransport();
