#pragma once
#include "OAuthRefresher.hpp"
#include "StoredCredential.hpp"
#include "net/IHttpTransport.hpp"
#include "quota/ProbeError.hpp"
#include <mutex>
#include <optional>

// Sends bearer-authenticated requests. A stale or rejected token gets
// exactly one refresh and the request exactly one retry; anything past
// that is classified and thrown.
class AuthorizedClient {
public:
    // refresher may be null for providers without a refresh flow
    AuthorizedClient(IHttpTransport& transport,
                     ICredentialStore& store,
                     OAuthRefresher* refresher = nullptr)
        : transport_(transport), store_(store), refresher_(refresher) {}

    // Throws ProbeError: AuthenticationRequired (no credential or a
    // rejected setup token), SessionExpired (refresh impossible or
    // rejected), ExecutionFailed (transport). Other HTTP statuses are
    // returned to the caller.
    HttpResponse send(HttpRequest request, TimePoint now = Clock::now());

    // Credential used by the last send(), after any refresh
    const std::optional<StoredCredential>& credential() const { return credential_; }

private:
    HttpResponse sendWith(HttpRequest request, const StoredCredential& cred);
    StoredCredential refreshLocked(const StoredCredential& stale, TimePoint now);
    ProbeError expired() const;

    IHttpTransport&   transport_;
    ICredentialStore& store_;
    OAuthRefresher*   refresher_;
    std::optional<StoredCredential> credential_;
    std::mutex refreshMtx_;
};
