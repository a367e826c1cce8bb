#include "parsers/ZoneClock.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace {

const fs::path kZoneInfoDir = "/usr/share/zoneinfo";

struct LocalType {
    int32_t utcOffset = 0;   // seconds east of UTC
    bool    isDst = false;
};

// One POSIX TZ "Mm.w.d/time" transition rule
struct DstRule {
    int month = 0, week = 0, weekday = 0;
    int32_t time = 7200;     // local seconds after midnight
};

// Footer rule applying after the last listed transition
struct PosixRule {
    LocalType std;
    std::optional<LocalType> dst;
    DstRule start, end;
};

} // namespace

struct ZoneClock::ZoneData {
    std::vector<int64_t>   transitions;
    std::vector<uint8_t>   typeIndex;
    std::vector<LocalType> types;
    std::optional<PosixRule> footer;

    LocalType at(int64_t t) const;
};

namespace {

class Reader {
public:
    explicit Reader(const std::string& bytes) : bytes_(bytes) {}

    bool has(size_t n) const { return pos_ + n <= bytes_.size(); }
    void skip(size_t n) { pos_ += n; }
    size_t pos() const { return pos_; }

    int64_t be(int width) {
        uint64_t v = 0;
        for (int i = 0; i < width; ++i)
            v = (v << 8) | static_cast<uint8_t>(bytes_[pos_++]);
        if (width == 4) return static_cast<int32_t>(static_cast<uint32_t>(v));
        return static_cast<int64_t>(v);
    }

    uint8_t byte() { return static_cast<uint8_t>(bytes_[pos_++]); }

private:
    const std::string& bytes_;
    size_t pos_ = 0;
};

struct Counts {
    int64_t isut, isstd, leap, time, type, chars;
};

std::optional<Counts> readHeader(Reader& r, char& version) {
    if (!r.has(44)) return std::nullopt;
    std::string magic;
    for (int i = 0; i < 4; ++i) magic += static_cast<char>(r.byte());
    if (magic != "TZif") return std::nullopt;
    version = static_cast<char>(r.byte());
    r.skip(15);
    Counts c{r.be(4), r.be(4), r.be(4), r.be(4), r.be(4), r.be(4)};
    if (c.isut < 0 || c.isstd < 0 || c.leap < 0 || c.time < 0 || c.type <= 0 || c.chars < 0)
        return std::nullopt;
    return c;
}

// ── POSIX TZ footer ───────────────────────────────────────────────────────

bool parseName(const std::string& s, size_t& i) {
    if (i < s.size() && s[i] == '<') {
        size_t close = s.find('>', i);
        if (close == std::string::npos) return false;
        i = close + 1;
        return true;
    }
    size_t begin = i;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    return i - begin >= 3;
}

// [+-]hh[:mm[:ss]] in seconds
std::optional<int32_t> parseClock(const std::string& s, size_t& i) {
    int sign = 1;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        if (s[i] == '-') sign = -1;
        ++i;
    }
    int32_t parts[3] = {0, 0, 0};
    for (int p = 0; p < 3; ++p) {
        if (p > 0) {
            if (i >= s.size() || s[i] != ':') break;
            ++i;
        }
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i])))
            return std::nullopt;
        int32_t v = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) && v < 1000)
            v = v * 10 + (s[i++] - '0');
        parts[p] = v;
    }
    return sign * (parts[0] * 3600 + parts[1] * 60 + parts[2]);
}

std::optional<DstRule> parseRule(const std::string& s, size_t& i) {
    if (i >= s.size() || s[i] != 'M') return std::nullopt;
    ++i;
    DstRule rule;
    int* fields[3] = {&rule.month, &rule.week, &rule.weekday};
    for (int f = 0; f < 3; ++f) {
        if (f > 0) {
            if (i >= s.size() || s[i] != '.') return std::nullopt;
            ++i;
        }
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i])))
            return std::nullopt;
        int v = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) && v < 100)
            v = v * 10 + (s[i++] - '0');
        *fields[f] = v;
    }
    if (rule.month < 1 || rule.month > 12 || rule.week < 1 || rule.week > 5 ||
        rule.weekday > 6)
        return std::nullopt;
    if (i < s.size() && s[i] == '/') {
        ++i;
        auto t = parseClock(s, i);
        if (!t) return std::nullopt;
        rule.time = *t;
    }
    return rule;
}

std::optional<PosixRule> parsePosix(const std::string& s) {
    size_t i = 0;
    PosixRule rule;
    if (!parseName(s, i)) return std::nullopt;
    auto stdOffset = parseClock(s, i);
    if (!stdOffset) return std::nullopt;
    rule.std.utcOffset = -*stdOffset;   // POSIX offsets count west of UTC
    if (i == s.size()) return rule;

    if (!parseName(s, i)) return std::nullopt;
    LocalType dst{rule.std.utcOffset + 3600, true};
    if (i < s.size() && s[i] != ',') {
        auto dstOffset = parseClock(s, i);
        if (!dstOffset) return std::nullopt;
        dst.utcOffset = -*dstOffset;
    }
    // Julian-day rules are not used by current zones; keep standard time
    if (i >= s.size() || s[i] != ',') return rule;
    ++i;
    auto start = parseRule(s, i);
    if (!start || i >= s.size() || s[i] != ',') return rule;
    ++i;
    auto end = parseRule(s, i);
    if (!end) return rule;

    rule.dst   = dst;
    rule.start = *start;
    rule.end   = *end;
    return rule;
}

// Local seconds since epoch of a rule's transition in `year`
int64_t ruleLocalTime(const DstRule& rule, int year) {
    std::tm first{};
    first.tm_year = year - 1900;
    first.tm_mon  = rule.month - 1;
    first.tm_mday = 1;
    std::time_t monthStart = timegm(&first);
    int firstWeekday = first.tm_wday;

    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int daysInMonth = kDays[rule.month - 1];
    if (rule.month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
        daysInMonth = 29;

    int day = 1 + (rule.weekday - firstWeekday + 7) % 7 + (rule.week - 1) * 7;
    while (day > daysInMonth) day -= 7;
    return static_cast<int64_t>(monthStart) + int64_t(day - 1) * 86400 + rule.time;
}

LocalType footerAt(const PosixRule& rule, int64_t t) {
    if (!rule.dst) return rule.std;
    std::time_t shifted = static_cast<std::time_t>(t + rule.std.utcOffset);
    std::tm ymd{};
    gmtime_r(&shifted, &ymd);
    int year = ymd.tm_year + 1900;

    int64_t start = ruleLocalTime(rule.start, year) - rule.std.utcOffset;
    int64_t end   = ruleLocalTime(rule.end, year) - rule.dst->utcOffset;
    bool inDst = start < end ? (t >= start && t < end)
                             : !(t >= end && t < start);
    return inDst ? *rule.dst : rule.std;
}

std::shared_ptr<const ZoneClock::ZoneData> loadZone(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return nullptr;
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Reader r(bytes);
    char version = 0;
    auto counts = readHeader(r, version);
    if (!counts) return nullptr;

    int width = 4;
    if (version >= '2') {
        // Skip the 32-bit block; the 64-bit one follows with its own header
        r.skip(counts->time * 5 + counts->type * 6 + counts->chars + counts->leap * 8 +
               counts->isstd + counts->isut);
        counts = readHeader(r, version);
        if (!counts) return nullptr;
        width = 8;
    }

    size_t need = counts->time * (width + 1) + counts->type * 6 + counts->chars +
                  counts->leap * (width + 4) + counts->isstd + counts->isut;
    if (!r.has(need)) return nullptr;

    auto zone = std::make_shared<ZoneClock::ZoneData>();
    for (int64_t i = 0; i < counts->time; ++i) zone->transitions.push_back(r.be(width));
    for (int64_t i = 0; i < counts->time; ++i) {
        uint8_t idx = r.byte();
        if (idx >= counts->type) return nullptr;
        zone->typeIndex.push_back(idx);
    }
    for (int64_t i = 0; i < counts->type; ++i) {
        LocalType type;
        type.utcOffset = static_cast<int32_t>(r.be(4));
        type.isDst = r.byte() != 0;
        r.skip(1);
        zone->types.push_back(type);
    }
    r.skip(counts->chars + counts->leap * (width + 4) + counts->isstd + counts->isut);

    if (width == 8 && r.has(1) && bytes[r.pos()] == '\n') {
        size_t close = bytes.find('\n', r.pos() + 1);
        if (close != std::string::npos) {
            std::string tz = bytes.substr(r.pos() + 1, close - r.pos() - 1);
            if (!tz.empty()) {
                zone->footer = parsePosix(tz);
                if (!zone->footer)
                    spdlog::debug("ZoneClock: unsupported rule '{}' in {}", tz, path.string());
            }
        }
    }
    return zone;
}

} // namespace

LocalType ZoneClock::ZoneData::at(int64_t t) const {
    if (transitions.empty() || t < transitions.front()) {
        if (transitions.empty() && footer) return footerAt(*footer, t);
        return types.front();
    }
    if (t >= transitions.back() && footer) return footerAt(*footer, t);
    auto it = std::upper_bound(transitions.begin(), transitions.end(), t);
    return types[typeIndex[std::distance(transitions.begin(), it) - 1]];
}

ZoneClock::ZoneClock(std::string zone) : zone_(std::move(zone)) {
    if (zone_.empty()) return;
    if (zoneExists(zone_)) data_ = loadZone(kZoneInfoDir / zone_);
    if (!data_)
        spdlog::debug("ZoneClock: unknown zone '{}', using local time", zone_);
}

bool ZoneClock::zoneExists(const std::string& zone) {
    if (zone.empty() || zone.find("..") != std::string::npos || zone[0] == '/')
        return false;
    std::error_code ec;
    return fs::is_regular_file(kZoneInfoDir / zone, ec);
}

std::tm ZoneClock::wallClock(TimePoint instant) const {
    std::time_t t = Clock::to_time_t(instant);
    std::tm out{};
    if (!data_) {
        localtime_r(&t, &out);
        return out;
    }
    LocalType type = data_->at(t);
    std::time_t shifted = t + type.utcOffset;
    gmtime_r(&shifted, &out);
    out.tm_isdst = type.isDst ? 1 : 0;
    return out;
}

TimePoint ZoneClock::toInstant(int year, int month, int day, int hour, int minute) const {
    std::tm tm{};
    tm.tm_year  = year - 1900;
    tm.tm_mon   = month - 1;
    tm.tm_mday  = day;
    tm.tm_hour  = hour;
    tm.tm_min   = minute;
    tm.tm_isdst = -1;
    if (!data_) return Clock::from_time_t(std::mktime(&tm));

    int64_t local = timegm(&tm);
    // Offset at the guessed instant, then once more across a transition
    int64_t t = local - data_->at(local).utcOffset;
    int32_t offset = data_->at(t).utcOffset;
    t = local - offset;
    return Clock::from_time_t(static_cast<std::time_t>(t));
}
