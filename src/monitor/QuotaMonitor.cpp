#include "monitor/QuotaMonitor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

void QuotaMonitor::addProbe(std::unique_ptr<IUsageProbe> probe) {
    std::unique_lock lock(mtx_);
    std::shared_ptr<IUsageProbe> p(std::move(probe));
    auto it = std::find_if(probes_.begin(), probes_.end(),
                           [&](auto& existing) { return existing->id() == p->id(); });
    if (it != probes_.end())
        *it = std::move(p);
    else
        probes_.push_back(std::move(p));
}

void QuotaMonitor::removeProbe(const std::string& id) {
    std::unique_lock lock(mtx_);
    probes_.erase(std::remove_if(probes_.begin(), probes_.end(),
                                 [&](auto& p) { return p->id() == id; }),
                  probes_.end());
    states_.erase(id);
}

std::vector<std::string> QuotaMonitor::probeIds() const {
    std::shared_lock lock(mtx_);
    std::vector<std::string> ids;
    for (auto& p : probes_) ids.push_back(p->id());
    return ids;
}

void QuotaMonitor::setAlertSink(AlertSink sink) {
    std::unique_lock lock(mtx_);
    sink_ = std::move(sink);
}

QuotaMonitor::Outcome QuotaMonitor::runProbe(IUsageProbe& probe) {
    Outcome out;
    out.id = probe.id();
    try {
        out.available = probe.isAvailable();
        if (!out.available) {
            spdlog::debug("{}: not available, skipping", out.id);
            return out;
        }
        out.snapshot = probe.probe();
        spdlog::info("{}: {} quota(s)", out.id, out.snapshot->quotas.size());
    } catch (const ProbeError& e) {
        spdlog::warn("{}: {}", out.id, e.what());
        out.error = e;
    } catch (const std::exception& e) {
        spdlog::error("{}: unexpected failure: {}", out.id, e.what());
        out.error = ProbeError::executionFailed(e.what());
    }
    return out;
}

bool QuotaMonitor::record(Outcome outcome) {
    std::optional<QuotaAlert> alert;
    AlertSink sink;
    bool ok = outcome.snapshot.has_value();
    {
        std::unique_lock lock(mtx_);
        auto& st = states_[outcome.id];
        st.available = outcome.available;
        if (outcome.error) st.lastError = std::move(outcome.error);
        if (outcome.snapshot) {
            QuotaStatus previous = st.status;
            st.status    = outcome.snapshot->overallStatus(thresholds_);
            st.snapshot  = std::move(outcome.snapshot);
            st.lastError.reset();
            if (previous != st.status)
                alert = alerter_.onStatusChanged(outcome.id, previous, st.status);
        }
        sink = sink_;
    }
    if (alert) {
        spdlog::warn("{}: {}", alert->title, alert->body);
        if (sink) sink(*alert);
    }
    return ok;
}

std::vector<std::string> QuotaMonitor::refreshAll() {
    std::vector<std::shared_ptr<IUsageProbe>> probes;
    {
        std::shared_lock lock(mtx_);
        probes = probes_;
    }

    std::vector<std::future<Outcome>> pending;
    pending.reserve(probes.size());
    for (auto& p : probes)
        pending.push_back(std::async(std::launch::async, [p] { return runProbe(*p); }));

    std::vector<std::string> refreshed;
    for (auto& f : pending) {
        Outcome out = f.get();
        std::string id = out.id;
        if (record(std::move(out)))
            refreshed.push_back(id);
    }
    return refreshed;
}

bool QuotaMonitor::refresh(const std::string& id) {
    std::shared_ptr<IUsageProbe> probe;
    {
        std::shared_lock lock(mtx_);
        for (auto& p : probes_)
            if (p->id() == id) probe = p;
    }
    if (!probe) return false;
    return record(runProbe(*probe));
}

std::optional<ProviderState> QuotaMonitor::state(const std::string& id) const {
    std::shared_lock lock(mtx_);
    auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

std::optional<UsageSnapshot> QuotaMonitor::snapshot(const std::string& id) const {
    std::shared_lock lock(mtx_);
    auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second.snapshot;
}

QuotaStatus QuotaMonitor::overallStatus() const {
    std::shared_lock lock(mtx_);
    QuotaStatus worst = QuotaStatus::Healthy;
    for (auto& [id, st] : states_)
        if (st.snapshot) worst = std::max(worst, st.status);
    return worst;
}

std::optional<UsageQuota> QuotaMonitor::lowestQuota() const {
    std::shared_lock lock(mtx_);
    std::optional<UsageQuota> lowest;
    for (auto& [id, st] : states_) {
        if (!st.snapshot) continue;
        if (auto* q = st.snapshot->lowestQuota(); q && (!lowest || *q < *lowest))
            lowest = *q;
    }
    return lowest;
}
