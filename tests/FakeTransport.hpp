#pragma once
#include "auth/StoredCredential.hpp"
#include "net/IHttpTransport.hpp"
#include <deque>
#include <functional>
#include <vector>

// Scripted HTTP: replies in order, or through a handler when one is set.
// Records every request it sees.
class FakeTransport : public IHttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    void reply(int status, std::string body = "") {
        HttpResponse res;
        res.status = status;
        res.body   = std::move(body);
        responses.push_back(res);
    }

    void fail(std::string error) {
        HttpResponse res;
        res.error = std::move(error);
        responses.push_back(res);
    }

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        if (handler) return handler(request);
        if (responses.empty()) {
            HttpResponse res;
            res.error = "no scripted response";
            return res;
        }
        HttpResponse res = responses.front();
        responses.pop_front();
        return res;
    }

    std::vector<HttpRequest>  requests;
    std::deque<HttpResponse>  responses;
    Handler                   handler;
};

// Credential store held in memory
class MemoryCredentialStore : public ICredentialStore {
public:
    MemoryCredentialStore() = default;
    explicit MemoryCredentialStore(StoredCredential cred) : credential(std::move(cred)) {}

    std::optional<StoredCredential> load() override { return credential; }
    bool save(const StoredCredential& cred) override {
        saves++;
        credential = cred;
        return true;
    }

    std::optional<StoredCredential> credential;
    int saves = 0;
};

inline EnvLookup fakeEnvironment(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}
