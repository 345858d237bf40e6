/**
 * Unit tests for the common layer
 *
 * Covers Result<T>, error categories, the chip table, the clock, the
 * logger and the JSON configuration manager.
 */

#include "common/chips.h"
#include "common/clock.h"
#include "common/config.h"
#include "common/logging.h"
#include "common/types.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace fairduel::common;

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, SuccessCarriesValue) {
  Result<int> result(42);
  EXPECT_TRUE(result.is_ok());
  EXPECT_FALSE(result.is_err());
  EXPECT_EQ(result.value(), 42);
  EXPECT_EQ(result.code(), ErrorCode::OK);
  EXPECT_TRUE(static_cast<bool>(result));
}

TEST(ResultTest, FailureCarriesCodeAndMessage) {
  Result<int> result(ErrorCode::NOT_FOUND, "missing");
  EXPECT_TRUE(result.is_err());
  EXPECT_EQ(result.code(), ErrorCode::NOT_FOUND);
  EXPECT_EQ(result.error(), "missing");
  EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, StringValueNeedsSuccessTag) {
  Result<std::string> ok(std::string("abc"), success_tag{});
  EXPECT_TRUE(ok.is_ok());
  EXPECT_EQ(ok.value(), "abc");

  Result<std::string> failed(ErrorCode::INTERNAL, "boom");
  EXPECT_TRUE(failed.is_err());
  EXPECT_EQ(failed.code(), ErrorCode::INTERNAL);
  EXPECT_EQ(failed.error(), "boom");
}

TEST(ResultTest, FromErrorKeepsCategory) {
  Result<bool> inner(ErrorCode::INSUFFICIENT_BALANCE, "need more");
  auto outer = Result<std::string>::from_error(inner);
  EXPECT_TRUE(outer.is_err());
  EXPECT_EQ(outer.code(), ErrorCode::INSUFFICIENT_BALANCE);
  EXPECT_EQ(outer.error(), "need more");
}

TEST(ErrorCodeTest, StateConflictFamily) {
  EXPECT_TRUE(is_state_conflict(ErrorCode::STATE_CONFLICT));
  EXPECT_TRUE(is_state_conflict(ErrorCode::NOT_AVAILABLE));
  EXPECT_TRUE(is_state_conflict(ErrorCode::SELF_JOIN));
  EXPECT_TRUE(is_state_conflict(ErrorCode::EXPIRED));
  EXPECT_TRUE(is_state_conflict(ErrorCode::ALREADY_SUBMITTED));
  EXPECT_FALSE(is_state_conflict(ErrorCode::VALIDATION));
  EXPECT_FALSE(is_state_conflict(ErrorCode::INSUFFICIENT_BALANCE));
  EXPECT_STREQ(error_code_name(ErrorCode::VALIDATION), "VALIDATION_ERROR");
  EXPECT_STREQ(error_code_name(ErrorCode::VERIFICATION), "VERIFICATION_ERROR");
}

// ============================================================================
// Chips
// ============================================================================

TEST(ChipTest, ValuesMatchTable) {
  EXPECT_EQ(chip_value(ChipType::SMILE), 5);
  EXPECT_EQ(chip_value(ChipType::HEART), 10);
  EXPECT_EQ(chip_value(ChipType::FIRE), 25);
  EXPECT_EQ(chip_value(ChipType::RING), 50);
  EXPECT_EQ(calculate_total_stake(ChipType::FIRE, 4), 100);
}

TEST(ChipTest, ParsesCaseInsensitively) {
  EXPECT_EQ(parse_chip_type("ring"), ChipType::RING);
  EXPECT_EQ(parse_chip_type("Heart"), ChipType::HEART);
  EXPECT_FALSE(parse_chip_type("diamond").has_value());
  EXPECT_FALSE(parse_chip_type("").has_value());
}

// ============================================================================
// Clock
// ============================================================================

TEST(ClockTest, ManualClockAdvances) {
  ManualClock clock(1000);
  EXPECT_EQ(clock.now_ms(), 1000);
  clock.advance(std::chrono::seconds(2));
  EXPECT_EQ(clock.now_ms(), 3000);
  clock.set(50);
  EXPECT_EQ(clock.now_ms(), 50);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggingTest, ParsesLevels) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
  EXPECT_EQ(parse_log_level("nonsense"), LogLevel::INFO);
  EXPECT_STREQ(log_level_name(LogLevel::ERROR), "ERROR");
}

TEST(LoggingTest, LevelFiltering) {
  auto &logger = Logger::instance();
  logger.set_level(LogLevel::WARN);
  EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
  EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));
  logger.set_level(LogLevel::INFO);
  EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
}

namespace {

class CountingAlertChannel : public IAlertChannel {
public:
  explicit CountingAlertChannel(std::shared_ptr<std::vector<std::string>> seen)
      : seen_(std::move(seen)) {}

  void send_alert(const LogEntry &entry) override {
    seen_->push_back(entry.module + ":" + entry.error_code);
  }
  bool is_enabled() const override { return true; }
  std::string get_name() const override { return "counting"; }

private:
  std::shared_ptr<std::vector<std::string>> seen_;
};

} // namespace

TEST(LoggingTest, CriticalFailuresAlertOncePerInterval) {
  auto seen = std::make_shared<std::vector<std::string>>();
  Logger::instance().add_alert_channel(
      std::make_unique<CountingAlertChannel>(seen));

  LOG_CRITICAL_FAILURE("alert_test", "first", "E_ONE");
  LOG_CRITICAL_FAILURE("alert_test", "repeat", "E_ONE");
  LOG_CRITICAL_FAILURE("alert_test", "other", "E_TWO");

  EXPECT_EQ(*seen, (std::vector<std::string>{"alert_test:E_ONE",
                                             "alert_test:E_TWO"}));
}

// ============================================================================
// Configuration
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override { unsetenv("FAIRDUEL_TEST_SECRET"); }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  auto config = ConfigManager::create_default();
  EXPECT_EQ(config.confirmation_timeout, std::chrono::milliseconds(120000));
  EXPECT_EQ(config.round_ceiling, std::chrono::milliseconds(300000));
  EXPECT_EQ(config.submission_window, std::chrono::milliseconds(10000));
  EXPECT_EQ(config.max_missed_confirmations, 3u);
  EXPECT_EQ(config.min_games_required, 2u);
  EXPECT_TRUE(ConfigManager::validate_config(config).empty());
}

TEST_F(ConfigTest, LoadFromJsonOverridesOnlyGivenKeys) {
  nlohmann::json j = {
      {"orders", {{"confirmation_timeout_ms", 5000}, {"max_games_planned", 6}}},
      {"rounds", {{"submission_window_ms", 2000}}},
      {"logging", {{"level", "DEBUG"}}}};

  auto config = ConfigManager::load_from_json(j);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->confirmation_timeout, std::chrono::milliseconds(5000));
  EXPECT_EQ(config->max_games_planned, 6u);
  EXPECT_EQ(config->submission_window, std::chrono::milliseconds(2000));
  EXPECT_EQ(config->round_ceiling, std::chrono::milliseconds(300000));
  EXPECT_EQ(config->log_level, "DEBUG");
}

TEST_F(ConfigTest, RejectsInvalidConfiguration) {
  nlohmann::json window_too_long = {
      {"rounds", {{"round_ceiling_ms", 1000}, {"submission_window_ms", 5000}}}};
  EXPECT_FALSE(ConfigManager::load_from_json(window_too_long).has_value());

  nlohmann::json wrong_type = {{"orders", {{"max_games_planned", "ten"}}}};
  EXPECT_FALSE(ConfigManager::load_from_json(wrong_type).has_value());

  EngineConfig config;
  config.min_games_required = 5;
  EXPECT_FALSE(ConfigManager::validate_config(config).empty());
}

TEST_F(ConfigTest, SerialisationNeverLeaksSecret) {
  EngineConfig config;
  config.platform_secret = "super-secret";
  auto j = ConfigManager::to_json(config);
  EXPECT_EQ(j.dump().find("super-secret"), std::string::npos);

  auto reloaded = ConfigManager::load_from_json(j);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->confirmation_timeout, config.confirmation_timeout);
}

TEST_F(ConfigTest, SecretResolution) {
  EngineConfig config;
  config.platform_secret_env = "FAIRDUEL_TEST_SECRET";
  unsetenv("FAIRDUEL_TEST_SECRET");
  EXPECT_THROW(ConfigManager::resolve_platform_secret(config),
               std::runtime_error);

  setenv("FAIRDUEL_TEST_SECRET", "from-env", 1);
  EXPECT_EQ(ConfigManager::resolve_platform_secret(config), "from-env");

  config.platform_secret = "explicit";
  EXPECT_EQ(ConfigManager::resolve_platform_secret(config), "explicit");
}
