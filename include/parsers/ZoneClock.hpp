#pragma once
#include "quota/UsageQuota.hpp"
#include <ctime>
#include <memory>
#include <optional>
#include <string>

// Wall-clock <-> instant conversion in a named IANA zone, read from the
// system zoneinfo database. An empty or unknown zone means the local zone.
// Never touches the process environment, so conversions are safe to run
// from concurrent probes.
class ZoneClock {
public:
    explicit ZoneClock(std::string zone = "");

    const std::string& zone() const { return zone_; }
    bool isKnownZone() const { return data_ != nullptr; }

    // Broken-down wall-clock time of `instant` in this zone
    std::tm wallClock(TimePoint instant) const;

    // Instant for a wall-clock time in this zone (month 1..12)
    TimePoint toInstant(int year, int month, int day, int hour, int minute) const;

    static bool zoneExists(const std::string& zone);

    struct ZoneData;

private:
    std::string zone_;
    std::shared_ptr<const ZoneData> data_;
};
