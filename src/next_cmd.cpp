#include "commands.hpp"
#include "config.hpp"
#include "schedule.hpp"
#include <iostream>

namespace cmdb {

int cmd_next(const std::string& config_path, const std::string& expression, int count) {
    std::string expr = expression;
    if (expr.empty()) {
        try {
            expr = Config::load(config_path).scheduler.expression;
        } catch (const ConfigError& e) {
            std::cerr << "[next] " << e.what() << "\n";
            return 1;
        }
    }

    ScheduleOraclePtr schedule;
    try {
        schedule = parse_schedule(expr);
    } catch (const ScheduleParseError& e) {
        std::cerr << "Invalid schedule: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Schedule \"" << expr << "\":\n";
    TimePoint t = Clock::now();
    for (int i = 0; i < count; ++i) {
        auto next = schedule->next(t);
        if (!next) {
            std::cout << "  no further activation within five years (indefinite)\n";
            break;
        }
        std::cout << "  " << format_time(*next) << "\n";
        t = *next;
    }
    return 0;
}

} // namespace cmdb
