#pragma once
#include "monitor/QuotaAlerter.hpp"
#include "probe/IUsageProbe.hpp"
#include "quota/ProbeError.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

// Latest outcome of probing one provider
struct ProviderState {
    std::optional<UsageSnapshot> snapshot;     // last successful result
    std::optional<ProbeError>    lastError;    // cleared on success
    QuotaStatus                  status = QuotaStatus::Healthy;
    bool                         available = false;
};

// Owns the probes and refreshes them concurrently. Each probe runs on its
// own std::async task; results are merged under the monitor's lock.
class QuotaMonitor {
public:
    using AlertSink = std::function<void(const QuotaAlert&)>;

    QuotaMonitor(const ProviderRegistry& registry, QuotaThresholds thresholds = {})
        : alerter_(registry), thresholds_(thresholds) {}

    // Replaces any probe with the same id
    void addProbe(std::unique_ptr<IUsageProbe> probe);
    void removeProbe(const std::string& id);
    std::vector<std::string> probeIds() const;

    void setAlertSink(AlertSink sink);

    // Probes every available provider. Returns the ids that produced a
    // snapshot, in registration order.
    std::vector<std::string> refreshAll();

    // Single provider; false when unknown, unavailable or failed
    bool refresh(const std::string& id);

    std::optional<ProviderState> state(const std::string& id) const;
    std::optional<UsageSnapshot> snapshot(const std::string& id) const;

    // Across every provider with a snapshot; worst wins
    QuotaStatus overallStatus() const;
    std::optional<UsageQuota> lowestQuota() const;

private:
    struct Outcome {
        std::string id;
        bool available = false;
        std::optional<UsageSnapshot> snapshot;
        std::optional<ProbeError> error;
    };

    static Outcome runProbe(IUsageProbe& probe);
    bool record(Outcome outcome);

    QuotaAlerter    alerter_;
    QuotaThresholds thresholds_;

    mutable std::shared_mutex mtx_;
    std::vector<std::shared_ptr<IUsageProbe>> probes_;
    std::map<std::string, ProviderState> states_;
    AlertSink sink_;
};
