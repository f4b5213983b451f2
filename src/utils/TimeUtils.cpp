#include "utils/TimeUtils.hpp"
#include "utils/TextUtils.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <strings.h>

namespace Pequod {

Timestamp nowTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static int monthIndex(const char* name) {
    static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    for (int i = 0; i < 12; ++i) {
        if (strncasecmp(name, months[i], 3) == 0) return i;
    }
    return -1;
}

// Offset from UTC in seconds, or false when the zone is not recognised.
static bool zoneOffset(const std::string& zone, long& offset) {
    offset = 0;
    if (zone.empty()) return true;
    if (zone[0] == '+' || zone[0] == '-') {
        std::string digits;
        for (char c : zone.substr(1)) {
            if (c >= '0' && c <= '9') digits += c;
        }
        if (digits.size() != 4) return false;
        long hours = std::atol(digits.substr(0, 2).c_str());
        long minutes = std::atol(digits.substr(2, 2).c_str());
        offset = (hours * 3600 + minutes * 60) * (zone[0] == '-' ? -1 : 1);
        return true;
    }
    struct Named { const char* name; int hours; };
    static const Named named[] = {
        {"gmt", 0}, {"ut", 0}, {"utc", 0}, {"z", 0},
        {"est", -5}, {"edt", -4}, {"cst", -6}, {"cdt", -5},
        {"mst", -7}, {"mdt", -6}, {"pst", -8}, {"pdt", -7}};
    std::string lower = toLower(zone);
    for (const auto& n : named) {
        if (lower == n.name) {
            offset = n.hours * 3600L;
            return true;
        }
    }
    return false;
}

static std::optional<Timestamp> makeUtc(int year, int month, int day, int hour, int minute, int second,
                                        long offset) {
    if (month < 0 || month > 11 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<Timestamp>(timegm(&tm)) - offset;
}

std::optional<Timestamp> parseRfc822(const std::string& text) {
    std::string s = trim(text);
    size_t comma = s.find(',');
    if (comma != std::string::npos) s = trim(s.substr(comma + 1));

    int day = 0, year = 0, hour = 0, minute = 0, second = 0;
    char monthName[4] = {0};
    char zone[16] = {0};
    int fields = std::sscanf(s.c_str(), "%d %3s %d %d:%d:%d %15s",
                             &day, monthName, &year, &hour, &minute, &second, zone);
    if (fields < 6) {
        // Seconds are optional.
        second = 0;
        zone[0] = '\0';
        fields = std::sscanf(s.c_str(), "%d %3s %d %d:%d %15s", &day, monthName, &year, &hour, &minute, zone);
        if (fields < 5) return std::nullopt;
    }
    if (year < 100) year += (year < 70) ? 2000 : 1900;

    long offset = 0;
    if (!zoneOffset(zone, offset)) return std::nullopt;
    return makeUtc(year, monthIndex(monthName), day, hour, minute, second, offset);
}

std::optional<Timestamp> parseRfc3339(const std::string& text) {
    std::string s = trim(text);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) return std::nullopt;
    std::string rest = s.substr(consumed);
    if (rest.empty()) return makeUtc(year, month - 1, day, 0, 0, 0, 0);
    if (rest[0] != 'T' && rest[0] != 't' && rest[0] != ' ') return std::nullopt;

    if (std::sscanf(rest.c_str() + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &consumed) != 3) {
        return std::nullopt;
    }
    rest = rest.substr(1 + consumed);
    if (!rest.empty() && rest[0] == '.') {
        size_t end = rest.find_first_not_of("0123456789", 1);
        rest = (end == std::string::npos) ? "" : rest.substr(end);
    }
    long offset = 0;
    if (!zoneOffset(rest, offset)) return std::nullopt;
    return makeUtc(year, month - 1, day, hour, minute, second, offset);
}

std::optional<Timestamp> parseFeedDate(const std::string& text) {
    if (auto ts = parseRfc3339(text)) return ts;
    return parseRfc822(text);
}

std::string formatTimestamp(Timestamp ts, const char* format) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[64];
    size_t n = std::strftime(buffer, sizeof(buffer), format, &local);
    return std::string(buffer, n);
}

}
