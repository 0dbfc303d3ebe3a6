// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe logging,
// dispatch engine, and runtime cadence settings. `ConfigurationLoader`
// translates environment variables into these structures so downstream
// modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "rescue_dispatch/dispatch_coordinator.hpp"
#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

/**
 * @brief Immutable bundle of runtime knobs for the dispatch service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables
 * directly.
 */
struct Configuration final {
    std::string log_directory{};                /**< Destination directory for structured logs. */
    std::string log_level{};                    /**< spdlog level name; empty keeps the default. */
    DispatchConfig dispatch{};                  /**< Deduplication, ageing, and planning limits. */
    Duration replan_interval{Duration{10.0}};   /**< Cadence of scheduled replans. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load(const std::filesystem::path& config_root);

  private:
    static DispatchConfig load_dispatch_config();
};

}  // namespace rescue_dispatch
