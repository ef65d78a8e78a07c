#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cryptofolio {
namespace backtest {

enum class RebalanceFrequency {
    NONE,       // buy-and-hold
    DAILY,
    WEEKLY,
    MONTHLY
};

// How period boundaries are located in the date index.
enum class BoundaryRule {
    CALENDAR,      // new calendar day / ISO week / calendar month vs. previous timestamp
    FIXED_STRIDE   // every 1 / 7 / 30 days counted from the first timestamp
};

struct RebalanceConfig {
    RebalanceFrequency frequency = RebalanceFrequency::WEEKLY;
    BoundaryRule boundary_rule = BoundaryRule::CALENDAR;
    double initial_capital = 1.0;

    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str);
    static RebalanceFrequency parse_frequency(const std::string& freq_str);
    static BoundaryRule parse_boundary_rule(const std::string& rule_str);
};

std::string to_string(RebalanceFrequency frequency);
std::string to_string(BoundaryRule rule);

class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    // True if `date` opens a new rebalancing period. `prev_date` is the
    // preceding timestamp of the index, `origin_date` its first one.
    bool is_boundary(const std::string& origin_date,
                     const std::string& prev_date,
                     const std::string& date) const;

    // One flag per timestamp; index 0 is never a boundary.
    std::vector<bool> boundary_mask(const std::vector<std::string>& dates) const;

    // Stride in days of the FIXED_STRIDE rule, 0 for NONE.
    int stride_days() const;

    const RebalanceConfig& config() const { return config_; }

private:
    RebalanceConfig config_;

    bool check_calendar(const std::string& prev_date, const std::string& date) const;
    bool check_stride(const std::string& origin_date,
                      const std::string& prev_date,
                      const std::string& date) const;
};

} // namespace backtest
} // namespace cryptofolio
