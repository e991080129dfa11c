#pragma once
#include <string>
#include <bitset>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <ctime>

namespace cmdb {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class ScheduleParseError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Answers "when is the next activation after t". std::nullopt means the
// schedule has no defined next instant (indefinite) and should be asked
// again later.
class ScheduleOracle {
public:
    virtual ~ScheduleOracle() = default;
    virtual std::optional<TimePoint> next(TimePoint t) const = 0;
};

using ScheduleOraclePtr = std::unique_ptr<ScheduleOracle>;

// Six-field cron expression: sec min hour day-of-month month day-of-week.
class CronSchedule : public ScheduleOracle {
public:
    explicit CronSchedule(const std::string& expr);

    // Searches at most five years ahead, in local time.
    std::optional<TimePoint> next(TimePoint t) const override;

private:
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> dom_;      // 1..31
    std::bitset<13> months_;   // 1..12
    std::bitset<7> dow_;       // 0..6, Sunday = 0
    bool dom_star_ = false;
    bool dow_star_ = false;

    bool day_matches(const std::tm& tm) const;
};

// "@every <duration>": fixed delay, rounded down to whole seconds, at
// least one second.
class EverySchedule : public ScheduleOracle {
public:
    explicit EverySchedule(std::chrono::nanoseconds interval);

    std::optional<TimePoint> next(TimePoint t) const override;

    std::chrono::seconds interval() const { return interval_; }

private:
    std::chrono::seconds interval_;
};

// Accepts cron expressions, @yearly/@annually/@monthly/@weekly/@daily/
// @midnight/@hourly and "@every <duration>". Throws ScheduleParseError.
ScheduleOraclePtr parse_schedule(const std::string& expr);

// "1h30m10s", "1.5h", "300ms", "-2m". Units: ns, us (µs), ms, s, m, h.
std::chrono::nanoseconds parse_duration(const std::string& s);

} // namespace cmdb
