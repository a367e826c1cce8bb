#pragma once
#include "quota/UsageSnapshot.hpp"
#include <string>

// Abstract interface: one provider's "measure usage now" operation.
// Implementations own no schedule; callers decide the cadence.
class IUsageProbe {
public:
    virtual ~IUsageProbe() = default;

    virtual std::string id() const = 0;

    // Cheap check that the CLI or credential needed by probe() exists
    virtual bool isAvailable() = 0;

    // Throws ProbeError
    virtual UsageSnapshot probe() = 0;
};
