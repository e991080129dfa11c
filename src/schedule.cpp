#include "schedule.hpp"
#include "utils.hpp"
#include <sstream>
#include <vector>
#include <map>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace cmdb {

namespace {

struct Bounds {
    int min;
    int max;
    const std::map<std::string, int>* names;
};

const std::map<std::string, int> month_names = {
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12},
};

const std::map<std::string, int> dow_names = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3}, {"thu", 4}, {"fri", 5}, {"sat", 6},
};

const Bounds second_bounds{0, 59, nullptr};
const Bounds minute_bounds{0, 59, nullptr};
const Bounds hour_bounds{0, 23, nullptr};
const Bounds dom_bounds{1, 31, nullptr};
const Bounds month_bounds{1, 12, &month_names};
const Bounds dow_bounds{0, 6, &dow_names};

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream iss(s);
    while (std::getline(iss, item, sep)) out.push_back(item);
    if (!s.empty() && s.back() == sep) out.push_back("");
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int parse_value(const std::string& s, const Bounds& b) {
    if (b.names) {
        auto it = b.names->find(lower(s));
        if (it != b.names->end()) return it->second;
    }
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ScheduleParseError("failed to parse int from " + (s.empty() ? std::string("''") : s));
    }
    if (s.size() > 9) throw ScheduleParseError("value out of range: " + s);
    return std::stoi(s);
}

// One comma-separated term: "*", "?", "5", "1-5", "*/15", "3/15", "1-30/5".
// Returns true when the term is a bare wildcard.
template <std::size_t N>
bool parse_range(const std::string& expr, const Bounds& b, std::bitset<N>& bits) {
    auto range_and_step = split(expr, '/');
    if (range_and_step.size() > 2) {
        throw ScheduleParseError("too many slashes: " + expr);
    }
    auto low_high = split(range_and_step[0], '-');
    if (low_high.empty() || low_high[0].empty()) {
        throw ScheduleParseError("missing range start: " + expr);
    }
    if (low_high.size() > 2) {
        throw ScheduleParseError("too many hyphens: " + expr);
    }

    int start, end, step = 1;
    bool star = false;
    if (low_high[0] == "*" || low_high[0] == "?") {
        if (low_high.size() != 1) throw ScheduleParseError("wildcard cannot start a range: " + expr);
        start = b.min;
        end = b.max;
        star = true;
    } else {
        start = parse_value(low_high[0], b);
        end = low_high.size() == 2 ? parse_value(low_high[1], b) : start;
    }

    if (range_and_step.size() == 2) {
        step = parse_value(range_and_step[1], Bounds{0, 0, nullptr});
        // "N/step" means "N-max/step"
        if (low_high.size() == 1 && !star) end = b.max;
        star = false;
    }

    if (start < b.min) {
        throw ScheduleParseError("beginning of range (" + std::to_string(start) +
                                 ") below minimum (" + std::to_string(b.min) + "): " + expr);
    }
    if (end > b.max) {
        throw ScheduleParseError("end of range (" + std::to_string(end) +
                                 ") above maximum (" + std::to_string(b.max) + "): " + expr);
    }
    if (start > end) {
        throw ScheduleParseError("beginning of range (" + std::to_string(start) +
                                 ") beyond end of range (" + std::to_string(end) + "): " + expr);
    }
    if (step == 0) {
        throw ScheduleParseError("step of range should be a positive number: " + expr);
    }

    for (int v = start; v <= end; v += step) bits.set(static_cast<std::size_t>(v));
    return star;
}

template <std::size_t N>
bool parse_field(const std::string& field, const Bounds& b, std::bitset<N>& bits) {
    if (field.empty()) throw ScheduleParseError("empty field");
    bool star = false;
    for (auto& term : split(field, ',')) {
        if (term.empty()) throw ScheduleParseError("empty list item in " + field);
        star = parse_range(term, b, bits) || star;
    }
    return star;
}

const std::map<std::string, std::string> descriptors = {
    {"@yearly", "0 0 0 1 1 *"},
    {"@annually", "0 0 0 1 1 *"},
    {"@monthly", "0 0 0 1 * *"},
    {"@weekly", "0 0 0 * * 0"},
    {"@daily", "0 0 0 * * *"},
    {"@midnight", "0 0 0 * * *"},
    {"@hourly", "0 0 * * * *"},
};

std::tm normalized(std::tm tm) {
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    return local_tm(t);
}

} // namespace

// ── CronSchedule ────────────────────────────────────────────────────

CronSchedule::CronSchedule(const std::string& expr) {
    std::istringstream iss(expr);
    std::vector<std::string> fields;
    std::string f;
    while (iss >> f) fields.push_back(f);
    if (fields.size() != 6) {
        throw ScheduleParseError("expected exactly 6 fields, found " + std::to_string(fields.size()) +
                                 ": \"" + expr + "\"");
    }
    try {
        parse_field(fields[0], second_bounds, seconds_);
        parse_field(fields[1], minute_bounds, minutes_);
        parse_field(fields[2], hour_bounds, hours_);
        dom_star_ = parse_field(fields[3], dom_bounds, dom_);
        parse_field(fields[4], month_bounds, months_);
        dow_star_ = parse_field(fields[5], dow_bounds, dow_);
    } catch (const ScheduleParseError& e) {
        throw ScheduleParseError(std::string(e.what()) + " in \"" + expr + "\"");
    }
}

bool CronSchedule::day_matches(const std::tm& tm) const {
    bool dom_match = dom_.test(static_cast<std::size_t>(tm.tm_mday));
    bool dow_match = dow_.test(static_cast<std::size_t>(tm.tm_wday));
    if (dom_star_ || dow_star_) return dom_match && dow_match;
    return dom_match || dow_match;
}

std::optional<TimePoint> CronSchedule::next(TimePoint t) const {
    // Start at the earliest possible second after t.
    auto start = std::chrono::time_point_cast<std::chrono::seconds>(t) + std::chrono::seconds(1);
    std::tm tm = local_tm(Clock::to_time_t(start));
    const int year_limit = tm.tm_year + 5;

    // When a field is advanced the lower fields are reset once, so the
    // search moves forward through whole units.
    bool added = false;
    while (tm.tm_year <= year_limit) {
        if (!months_.test(static_cast<std::size_t>(tm.tm_mon + 1))) {
            if (!added) {
                added = true;
                tm.tm_mday = 1;
                tm.tm_hour = 0;
                tm.tm_min = 0;
                tm.tm_sec = 0;
            }
            tm.tm_mon += 1;
            tm = normalized(tm);
            continue;
        }
        if (!day_matches(tm)) {
            if (!added) {
                added = true;
                tm.tm_hour = 0;
                tm.tm_min = 0;
                tm.tm_sec = 0;
            }
            tm.tm_mday += 1;
            tm = normalized(tm);
            continue;
        }
        if (!hours_.test(static_cast<std::size_t>(tm.tm_hour))) {
            if (!added) {
                added = true;
                tm.tm_min = 0;
                tm.tm_sec = 0;
            }
            tm.tm_hour += 1;
            tm = normalized(tm);
            continue;
        }
        if (!minutes_.test(static_cast<std::size_t>(tm.tm_min))) {
            if (!added) {
                added = true;
                tm.tm_sec = 0;
            }
            tm.tm_min += 1;
            tm = normalized(tm);
            continue;
        }
        if (!seconds_.test(static_cast<std::size_t>(tm.tm_sec))) {
            added = true;
            tm.tm_sec += 1;
            tm = normalized(tm);
            continue;
        }
        tm.tm_isdst = -1;
        return Clock::from_time_t(std::mktime(&tm));
    }
    return std::nullopt;
}

// ── EverySchedule ───────────────────────────────────────────────────

EverySchedule::EverySchedule(std::chrono::nanoseconds interval)
    : interval_(std::chrono::duration_cast<std::chrono::seconds>(interval)) {
    if (interval_ < std::chrono::seconds(1)) interval_ = std::chrono::seconds(1);
}

std::optional<TimePoint> EverySchedule::next(TimePoint t) const {
    return std::chrono::time_point_cast<std::chrono::seconds>(t) + interval_;
}

// ── Parsing ─────────────────────────────────────────────────────────

std::chrono::nanoseconds parse_duration(const std::string& input) {
    static const std::map<std::string, double> units = {
        {"ns", 1.0},
        {"us", 1e3},
        {"\xC2\xB5s", 1e3},   // U+00B5 micro sign
        {"\xCE\xBCs", 1e3},   // U+03BC greek mu
        {"ms", 1e6},
        {"s", 1e9},
        {"m", 60e9},
        {"h", 3600e9},
    };

    std::string s = input;
    double sign = 1.0;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        if (s[0] == '-') sign = -1.0;
        s = s.substr(1);
    }
    if (s == "0") return std::chrono::nanoseconds(0);
    if (s.empty()) throw ScheduleParseError("invalid duration \"" + input + "\"");

    double total = 0.0;
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t num_start = i;
        while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
        std::string number = s.substr(num_start, i - num_start);
        if (number.empty() || number == "." || std::count(number.begin(), number.end(), '.') > 1) {
            throw ScheduleParseError("invalid duration \"" + input + "\"");
        }
        std::size_t unit_start = i;
        while (i < s.size() && !std::isdigit(static_cast<unsigned char>(s[i])) && s[i] != '.') ++i;
        std::string unit = s.substr(unit_start, i - unit_start);
        if (unit.empty()) {
            throw ScheduleParseError("missing unit in duration \"" + input + "\"");
        }
        auto it = units.find(unit);
        if (it == units.end()) {
            throw ScheduleParseError("unknown unit \"" + unit + "\" in duration \"" + input + "\"");
        }
        total += std::stod(number) * it->second;
    }
    if (total > 9.2e18) throw ScheduleParseError("invalid duration \"" + input + "\"");
    return std::chrono::nanoseconds(static_cast<int64_t>(std::llround(sign * total)));
}

ScheduleOraclePtr parse_schedule(const std::string& expr) {
    std::string trimmed = expr;
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) trimmed.pop_back();
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) trimmed.erase(trimmed.begin());

    if (trimmed.empty()) throw ScheduleParseError("empty schedule expression");

    if (trimmed[0] == '@') {
        const std::string every = "@every ";
        if (trimmed.compare(0, every.size(), every) == 0) {
            std::string d = trimmed.substr(every.size());
            while (!d.empty() && d.front() == ' ') d.erase(d.begin());
            try {
                return std::make_unique<EverySchedule>(parse_duration(d));
            } catch (const ScheduleParseError& e) {
                throw ScheduleParseError("failed to parse duration in \"" + trimmed + "\": " + e.what());
            }
        }
        auto it = descriptors.find(lower(trimmed));
        if (it == descriptors.end()) {
            throw ScheduleParseError("unrecognized descriptor: " + trimmed);
        }
        return std::make_unique<CronSchedule>(it->second);
    }
    return std::make_unique<CronSchedule>(trimmed);
}

} // namespace cmdb
