#include "backtest/rebalance_scheduler.hpp"
#include "data/calendar.hpp"

#include <algorithm>
#include <cctype>

namespace cryptofolio {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.contains("frequency")) {
        cfg.frequency = parse_frequency(j.at("frequency").get<std::string>());
    }
    if (j.contains("boundary_rule")) {
        cfg.boundary_rule = parse_boundary_rule(j.at("boundary_rule").get<std::string>());
    }
    if (j.contains("initial_capital")) {
        cfg.initial_capital = j.at("initial_capital").get<double>();
        if (!(cfg.initial_capital > 0.0))
            throw std::invalid_argument("initial_capital must be positive");
    }
    return cfg;
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str) {
    RebalanceConfig cfg;
    cfg.frequency = parse_frequency(freq_str);
    return cfg;
}

RebalanceFrequency RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = to_lower(freq_str);
    if (s == "none" || s == "buy_and_hold" || s == "hold") return RebalanceFrequency::NONE;
    if (s == "daily" || s == "d") return RebalanceFrequency::DAILY;
    if (s == "weekly" || s == "w") return RebalanceFrequency::WEEKLY;
    if (s == "monthly" || s == "m" || s == "me") return RebalanceFrequency::MONTHLY;
    throw std::invalid_argument("Invalid rebalance frequency: " + freq_str);
}

BoundaryRule RebalanceConfig::parse_boundary_rule(const std::string& rule_str) {
    auto s = to_lower(rule_str);
    if (s == "calendar") return BoundaryRule::CALENDAR;
    if (s == "fixed_stride" || s == "stride") return BoundaryRule::FIXED_STRIDE;
    throw std::invalid_argument("Invalid boundary rule: " + rule_str);
}

std::string to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::NONE: return "none";
        case RebalanceFrequency::DAILY: return "daily";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
    }
    return "unknown";
}

std::string to_string(BoundaryRule rule) {
    return rule == BoundaryRule::CALENDAR ? "calendar" : "fixed_stride";
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config) {}

bool RebalanceScheduler::is_boundary(const std::string& origin_date,
                                     const std::string& prev_date,
                                     const std::string& date) const {
    if (config_.frequency == RebalanceFrequency::NONE) return false;
    if (config_.boundary_rule == BoundaryRule::FIXED_STRIDE)
        return check_stride(origin_date, prev_date, date);
    return check_calendar(prev_date, date);
}

std::vector<bool> RebalanceScheduler::boundary_mask(const std::vector<std::string>& dates) const {
    std::vector<bool> mask(dates.size(), false);
    for (size_t t = 1; t < dates.size(); ++t) {
        mask[t] = is_boundary(dates.front(), dates[t - 1], dates[t]);
    }
    return mask;
}

int RebalanceScheduler::stride_days() const {
    switch (config_.frequency) {
        case RebalanceFrequency::NONE: return 0;
        case RebalanceFrequency::DAILY: return 1;
        case RebalanceFrequency::WEEKLY: return 7;
        case RebalanceFrequency::MONTHLY: return 30;
    }
    return 0;
}

bool RebalanceScheduler::check_calendar(const std::string& prev_date, const std::string& date) const {
    switch (config_.frequency) {
        case RebalanceFrequency::NONE:
            return false;
        case RebalanceFrequency::DAILY:
            return calendar::days_since_epoch(date) != calendar::days_since_epoch(prev_date);
        case RebalanceFrequency::WEEKLY:
            // ISO weeks start on Monday, so week keys differ across a year end too
            return calendar::iso_week_start(date) != calendar::iso_week_start(prev_date);
        case RebalanceFrequency::MONTHLY:
            return calendar::month_key(date) != calendar::month_key(prev_date);
    }
    return false;
}

bool RebalanceScheduler::check_stride(const std::string& origin_date,
                                      const std::string& prev_date,
                                      const std::string& date) const {
    const long long stride = stride_days();
    if (stride <= 0) return false;
    long long origin = calendar::days_since_epoch(origin_date);
    long long p0 = (calendar::days_since_epoch(prev_date) - origin) / stride;
    long long p1 = (calendar::days_since_epoch(date) - origin) / stride;
    return p1 != p0;
}

} // namespace backtest
} // namespace cryptofolio
