#pragma once

#include "common/types.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fairduel {
namespace common {

/**
 * @brief Runtime configuration of the duel engine
 *
 * Defaults reproduce the production timings: two minutes for the owner to
 * confirm a joined order, a five minute ceiling per round and a ten second
 * window for the second player once the first number is in.
 */
struct EngineConfig {
  // Order lifecycle
  std::chrono::milliseconds confirmation_timeout{120000};
  uint32_t max_missed_confirmations = 3; ///< Order EXPIRES after this many
  uint32_t min_games_planned = MIN_GAMES_PLANNED;
  uint32_t max_games_planned = MAX_GAMES_PLANNED;
  double min_reliability_to_trade = 0.0; ///< 0.0 admits everyone

  // Round timing
  std::chrono::milliseconds round_ceiling{300000};
  std::chrono::milliseconds submission_window{10000};
  uint32_t min_games_required = MIN_GAMES_REQUIRED;

  // Timeout coordinator
  std::chrono::milliseconds sweep_interval{250};

  // Fairness
  std::string platform_secret_env = "FAIRDUEL_PLATFORM_SECRET";
  std::string platform_secret; ///< Overrides the environment when set

  // Logging
  std::string log_level = "INFO";
  bool json_logging = false;
  bool async_logging = false;
  bool async_notifications = true;
};

/**
 * @brief Engine configuration loader
 */
class ConfigManager {
public:
  static EngineConfig create_default();

  /**
   * @brief Load configuration from a JSON file
   * @return loaded configuration, or nullopt if the file is missing,
   * malformed or fails validation
   */
  static std::optional<EngineConfig> load_from_file(const std::string &path);

  /// Missing keys keep their defaults
  static std::optional<EngineConfig> load_from_json(const nlohmann::json &json);

  /// The secret is never serialised
  static nlohmann::json to_json(const EngineConfig &config);

  /**
   * @brief Validate configuration
   * @return error message, or empty string if valid
   */
  static std::string validate_config(const EngineConfig &config);

  /**
   * @brief Resolve the HMAC platform secret
   *
   * Uses config.platform_secret when set, otherwise the environment
   * variable named by config.platform_secret_env.
   *
   * @throws std::runtime_error when no secret is configured; the process
   * must not start without one
   */
  static std::string resolve_platform_secret(const EngineConfig &config);

  /// Push log level and format into the global Logger
  static void apply_logging(const EngineConfig &config);
};

} // namespace common
} // namespace fairduel
