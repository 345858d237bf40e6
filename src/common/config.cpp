#include "common/config.h"
#include "common/logging.h"
#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fairduel {
namespace common {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds read_ms(const json &j, const char *key,
                                  std::chrono::milliseconds fallback) {
  if (!j.contains(key))
    return fallback;
  return std::chrono::milliseconds(j.at(key).get<int64_t>());
}

} // namespace

EngineConfig ConfigManager::create_default() { return EngineConfig{}; }

std::optional<EngineConfig>
ConfigManager::load_from_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("config", "Cannot open config file: ", path);
    return std::nullopt;
  }

  try {
    json j = json::parse(file);
    return load_from_json(j);
  } catch (const json::exception &e) {
    LOG_ERROR("config", "Failed to parse config file ", path, ": ", e.what());
    return std::nullopt;
  }
}

std::optional<EngineConfig> ConfigManager::load_from_json(const json &j) {
  EngineConfig config = create_default();

  try {
    if (j.contains("orders")) {
      const auto &orders = j.at("orders");
      config.confirmation_timeout = read_ms(orders, "confirmation_timeout_ms",
                                            config.confirmation_timeout);
      config.max_missed_confirmations = orders.value(
          "max_missed_confirmations", config.max_missed_confirmations);
      config.min_games_planned =
          orders.value("min_games_planned", config.min_games_planned);
      config.max_games_planned =
          orders.value("max_games_planned", config.max_games_planned);
      config.min_reliability_to_trade = orders.value(
          "min_reliability_to_trade", config.min_reliability_to_trade);
    }

    if (j.contains("rounds")) {
      const auto &rounds = j.at("rounds");
      config.round_ceiling =
          read_ms(rounds, "round_ceiling_ms", config.round_ceiling);
      config.submission_window =
          read_ms(rounds, "submission_window_ms", config.submission_window);
      config.min_games_required =
          rounds.value("min_games_required", config.min_games_required);
    }

    config.sweep_interval =
        read_ms(j, "sweep_interval_ms", config.sweep_interval);

    if (j.contains("fairness")) {
      const auto &fairness = j.at("fairness");
      config.platform_secret_env =
          fairness.value("platform_secret_env", config.platform_secret_env);
      config.platform_secret =
          fairness.value("platform_secret", config.platform_secret);
    }

    if (j.contains("logging")) {
      const auto &logging = j.at("logging");
      config.log_level = logging.value("level", config.log_level);
      config.json_logging = logging.value("json", config.json_logging);
      config.async_logging = logging.value("async", config.async_logging);
    }

    config.async_notifications =
        j.value("async_notifications", config.async_notifications);
  } catch (const json::exception &e) {
    LOG_ERROR("config", "Invalid config value: ", e.what());
    return std::nullopt;
  }

  std::string error = validate_config(config);
  if (!error.empty()) {
    LOG_ERROR("config", "Invalid configuration: ", error);
    return std::nullopt;
  }
  return config;
}

json ConfigManager::to_json(const EngineConfig &config) {
  json j;
  j["orders"] = {
      {"confirmation_timeout_ms", config.confirmation_timeout.count()},
      {"max_missed_confirmations", config.max_missed_confirmations},
      {"min_games_planned", config.min_games_planned},
      {"max_games_planned", config.max_games_planned},
      {"min_reliability_to_trade", config.min_reliability_to_trade}};
  j["rounds"] = {{"round_ceiling_ms", config.round_ceiling.count()},
                 {"submission_window_ms", config.submission_window.count()},
                 {"min_games_required", config.min_games_required}};
  j["sweep_interval_ms"] = config.sweep_interval.count();
  j["fairness"] = {{"platform_secret_env", config.platform_secret_env}};
  j["logging"] = {{"level", config.log_level},
                  {"json", config.json_logging},
                  {"async", config.async_logging}};
  j["async_notifications"] = config.async_notifications;
  return j;
}

std::string ConfigManager::validate_config(const EngineConfig &config) {
  if (config.confirmation_timeout.count() <= 0) {
    return "Confirmation timeout must be positive";
  }

  if (config.round_ceiling.count() <= 0 ||
      config.submission_window.count() <= 0) {
    return "Round timeouts must be positive";
  }

  if (config.submission_window > config.round_ceiling) {
    return "Submission window cannot exceed the round ceiling";
  }

  if (config.min_games_planned < 1 ||
      config.min_games_planned > config.max_games_planned) {
    return "Invalid games planned range";
  }

  if (config.min_games_required > config.min_games_planned) {
    return "Minimum games required cannot exceed minimum games planned";
  }

  if (config.max_missed_confirmations == 0) {
    return "Max missed confirmations must be at least 1";
  }

  if (config.min_reliability_to_trade < 0.0 ||
      config.min_reliability_to_trade > 1.0) {
    return "Reliability threshold must be within [0, 1]";
  }

  if (config.sweep_interval.count() <= 0) {
    return "Sweep interval must be positive";
  }

  static const std::set<std::string> valid_log_levels = {
      "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
  if (valid_log_levels.count(config.log_level) == 0) {
    return "Invalid log level: " + config.log_level;
  }

  return "";
}

std::string ConfigManager::resolve_platform_secret(const EngineConfig &config) {
  if (!config.platform_secret.empty()) {
    return config.platform_secret;
  }

  const char *env = std::getenv(config.platform_secret_env.c_str());
  if (env == nullptr || env[0] == '\0') {
    LOG_CRITICAL_FAILURE("config", "Platform secret is not configured",
                         "MISSING_PLATFORM_SECRET",
                         {{"env", config.platform_secret_env}});
    throw std::runtime_error(config.platform_secret_env +
                             " is not configured");
  }
  return env;
}

void ConfigManager::apply_logging(const EngineConfig &config) {
  auto &logger = Logger::instance();
  logger.set_level(parse_log_level(config.log_level));
  logger.set_json_format(config.json_logging);
  logger.set_async_logging(config.async_logging);
}

} // namespace common
} // namespace fairduel
