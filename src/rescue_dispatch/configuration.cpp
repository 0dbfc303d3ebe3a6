// === Configuration Loader ====================================================
//
// Reads RESCUE_DISPATCH_* environment variables into Configuration. Every
// knob has a default; values that fail to parse, or that are not positive and
// finite, keep the default and log a warning. The dispatch limits are
// grouped in load_dispatch_config so the coordinator sees one DispatchConfig.

#include "rescue_dispatch/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "rescue_dispatch/logging.hpp"

namespace rescue_dispatch {

namespace {
constexpr double k_default_replan_interval_s{10.0};
constexpr double k_default_route_budget_s{5.0 * 3600.0};
constexpr double k_default_max_victim_age_s{24.0 * 3600.0};
constexpr double k_default_retention_s{3600.0};
constexpr double k_default_planning_limit_s{30.0};
constexpr double k_max_interval_s{24.0 * 3600.0}; /**< Upper bound for durations converted to clock ticks. */
constexpr int k_default_max_victims_per_responder{5};
constexpr std::string_view k_default_log_directory{"logs"};

double parse_double(const char* variable_name, double fallback, double max_value = std::numeric_limits<double>::max()) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    double parsed_value{};
    try {
        parsed_value = std::stod(raw_value);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
    // stod accepts "nan" and "inf"; neither is a usable distance or duration.
    if (!std::isfinite(parsed_value) || parsed_value <= 0.0 || parsed_value > max_value) {
        auto logger = get_logger();
        logger->warn("{}={} is not a positive finite value in range; using fallback {}", variable_name, raw_value, fallback);
        return fallback;
    }
    return parsed_value;
}

int parse_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    int parsed_value{};
    try {
        parsed_value = std::stoi(raw_value);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
    if (parsed_value <= 0) {
        auto logger = get_logger();
        logger->warn("{}={} must be positive; using fallback {}", variable_name, raw_value, fallback);
        return fallback;
    }
    return parsed_value;
}

bool parse_bool(const char* variable_name, bool fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string str_value{raw_value};
    std::transform(str_value.begin(), str_value.end(), str_value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (str_value == "1" || str_value == "true" || str_value == "yes" || str_value == "on") {
        return true;
    }
    if (str_value == "0" || str_value == "false" || str_value == "no" || str_value == "off") {
        return false;
    }
    auto logger = get_logger();
    logger->warn("Failed to parse boolean from {}; using fallback {}", variable_name, fallback);
    return fallback;
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load(const std::filesystem::path&) {
    Configuration config{};
    config.log_directory = parse_string("RESCUE_DISPATCH_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("RESCUE_DISPATCH_LOG_LEVEL", "");
    config.dispatch = load_dispatch_config();
    config.replan_interval = Duration{parse_double("RESCUE_DISPATCH_REPLAN_INTERVAL_S", k_default_replan_interval_s, k_max_interval_s)};

    logger->info(
        "Configuration loaded: merge_radius_m={} travel_speed_mps={:.3f} route_budget_s={} replan_interval_s={} replan_on_new_victim={}",
        config.dispatch.merge_radius_m,
        config.dispatch.travel_speed_mps,
        config.dispatch.max_route_duration.count(),
        config.replan_interval.count(),
        config.dispatch.replan_on_new_victim
    );

    return config;
}

DispatchConfig ConfigurationLoader::load_dispatch_config() {
    DispatchConfig dispatch{};
    dispatch.merge_radius_m = parse_double("RESCUE_DISPATCH_MERGE_RADIUS_M", k_default_merge_radius_m);
    dispatch.travel_speed_mps = parse_double("RESCUE_DISPATCH_TRAVEL_SPEED_MPS", k_default_travel_speed_mps);
    dispatch.max_route_duration = Duration{parse_double("RESCUE_DISPATCH_ROUTE_BUDGET_S", k_default_route_budget_s)};
    dispatch.max_victims_per_responder = parse_int("RESCUE_DISPATCH_MAX_VICTIMS_PER_RESPONDER", k_default_max_victims_per_responder);
    dispatch.max_victim_age = Duration{parse_double("RESCUE_DISPATCH_MAX_VICTIM_AGE_S", k_default_max_victim_age_s)};
    dispatch.retention_window = Duration{parse_double("RESCUE_DISPATCH_RETENTION_S", k_default_retention_s)};
    dispatch.planning_time_limit = Duration{parse_double("RESCUE_DISPATCH_PLANNING_LIMIT_S", k_default_planning_limit_s, k_max_interval_s)};
    dispatch.replan_on_new_victim = parse_bool("RESCUE_DISPATCH_REPLAN_ON_NEW_VICTIM", true);
    return dispatch;
}

}  // namespace rescue_dispatch
