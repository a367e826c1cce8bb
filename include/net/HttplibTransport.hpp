#pragma once
#include "IHttpTransport.hpp"
#include <string>

class HttplibTransport : public IHttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override;

    // "https://api.example.com:8443/v1/x?y=1" -> {"https://api.example.com:8443", "/v1/x?y=1"}
    static std::pair<std::string, std::string> splitUrl(const std::string& url);
};
