#include "auth/AuthorizedClient.hpp"
#include "quota/ProbeError.hpp"
#include <spdlog/spdlog.h>

namespace {

bool isAuthFailure(int status) { return status == 401 || status == 403; }

} // namespace

ProbeError AuthorizedClient::expired() const {
    return ProbeError::sessionExpired(refresher_ ? refresher_->loginHint() : "");
}

HttpResponse AuthorizedClient::sendWith(HttpRequest request, const StoredCredential& cred) {
    request.headers["Authorization"] = "Bearer " + cred.accessToken;
    auto res = transport_.send(request);
    if (res.status == 0)
        throw ProbeError::executionFailed(res.error.empty() ? "No response" : res.error);
    return res;
}

StoredCredential AuthorizedClient::refreshLocked(const StoredCredential& stale, TimePoint now) {
    std::lock_guard lock(refreshMtx_);

    // Another caller may have refreshed while we waited
    if (auto current = store_.load(); current && current->accessToken != stale.accessToken) {
        spdlog::debug("Credential already refreshed by another request");
        return *current;
    }

    if (!refresher_ || !stale.canRefresh()) throw expired();

    auto fresh = refresher_->refresh(stale, now);
    if (!store_.save(fresh))
        spdlog::warn("Refreshed credential could not be persisted");
    return fresh;
}

HttpResponse AuthorizedClient::send(HttpRequest request, TimePoint now) {
    auto loaded = store_.load();
    if (!loaded) throw ProbeError::authenticationRequired();
    StoredCredential cred = *loaded;
    credential_ = cred;

    bool refreshed = false;
    if (refresher_ && cred.canRefresh() && cred.expiresAt && cred.needsRefresh(now)) {
        spdlog::info("Access token expired or expiring, refreshing before request");
        cred = refreshLocked(cred, now);
        credential_ = cred;
        refreshed = true;
    }

    auto res = sendWith(request, cred);
    if (!isAuthFailure(res.status)) return res;

    if (cred.source == StoredCredential::Source::Environment) {
        spdlog::warn("Setup token rejected with HTTP {}", res.status);
        throw ProbeError::authenticationRequired();
    }
    // The provider's own CLI owns the refresh flow; it has to log in again
    if (!refresher_) throw ProbeError::authenticationRequired();
    if (refreshed || !cred.canRefresh()) throw expired();

    spdlog::info("Request rejected with HTTP {}, refreshing token", res.status);
    cred = refreshLocked(cred, now);
    credential_ = cred;

    auto retry = sendWith(request, cred);
    if (retry.status == 401) throw expired();
    if (retry.status == 403) throw ProbeError::authenticationRequired();
    return retry;
}
