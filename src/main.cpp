#include "common/clock.h"
#include "common/config.h"
#include "common/logging.h"
#include "engine/dto.h"
#include "engine/duel_engine.h"
#include "fairness/fairness_engine.h"
#include <cctype>
#include <chrono>
#include <iostream>
#include <map>
#include <random>
#include <string>

using namespace fairduel;
using namespace fairduel::common;

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [command] [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  simulate                   Play a full series between two "
               "in-memory players (default)"
            << std::endl;
  std::cout << "  determine                  Resolve a single round with the "
               "platform secret"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Common Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --secret SECRET            Platform secret (default: "
               "$FAIRDUEL_PLATFORM_SECRET)"
            << std::endl;
  std::cout << "  --log-level LEVEL          Log level (trace, debug, info, "
               "warn, error)"
            << std::endl;
  std::cout << "  --json                     Output in JSON format" << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Simulate Options:" << std::endl;
  std::cout << "  --games N                  Rounds in the series (default: 3)"
            << std::endl;
  std::cout << "  --chip TYPE                SMILE, HEART, FIRE or RING "
               "(default: HEART)"
            << std::endl;
  std::cout << "  --seed S                   Seed for the simulated players' "
               "numbers (default: 42)"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Determine Options:" << std::endl;
  std::cout << "  --duel-id ID               Duel (match) identifier" << std::endl;
  std::cout << "  --round N                  1-based round number" << std::endl;
  std::cout << "  --time-slot T              Time slot (default: current)"
            << std::endl;
  std::cout << "  --a ID:NUMBER              Player A id and number" << std::endl;
  std::cout << "  --b ID:NUMBER              Player B id and number" << std::endl;
}

bool parse_player(const std::string &text, fairness::PlayerEntry &out) {
  auto colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  try {
    size_t used = 0;
    std::string number = text.substr(colon + 1);
    out.number = std::stoll(number, &used);
    if (used != number.size()) {
      return false;
    }
  } catch (const std::exception &) {
    return false;
  }
  out.player_id = text.substr(0, colon);
  return true;
}

int run_determine(const EngineConfig &config,
                  const std::map<std::string, std::string> &options,
                  bool json_output) {
  fairness::RoundParams params;
  auto it = options.find("duel-id");
  if (it == options.end()) {
    std::cerr << "❌ --duel-id is required" << std::endl;
    return 1;
  }
  params.duel_id = it->second;

  try {
    it = options.find("round");
    params.round_number =
        it == options.end() ? 1 : static_cast<uint32_t>(std::stoul(it->second));
    it = options.find("time-slot");
    params.time_slot =
        it == options.end() ? fairness::calculate_time_slot(SystemClock().now_ms())
                            : std::stoll(it->second);
  } catch (const std::exception &e) {
    std::cerr << "❌ Invalid numeric option: " << e.what() << std::endl;
    return 1;
  }

  if (!options.count("a") || !parse_player(options.at("a"), params.player_a) ||
      !options.count("b") || !parse_player(options.at("b"), params.player_b)) {
    std::cerr << "❌ --a and --b must be given as ID:NUMBER" << std::endl;
    return 1;
  }

  fairness::FairnessEngine fairness_engine(ConfigManager::resolve_platform_secret(config));
  auto result = fairness_engine.determine_winner(params);
  if (result.is_err()) {
    if (json_output) {
      std::cout << engine::error_envelope(result).dump(2) << std::endl;
    } else {
      std::cerr << "❌ " << result.error() << std::endl;
    }
    return 1;
  }

  if (json_output) {
    std::cout << engine::success_envelope(engine::to_json(result.value())).dump(2)
              << std::endl;
    return 0;
  }

  auto display = fairness::FairnessEngine::format_for_display(result.value());
  std::cout << display.summary << "\n\n";
  for (const auto &step : display.steps) {
    std::cout << "  " << step << "\n";
  }
  std::cout << "\n" << display.result << "\n";
  std::cout << "Verify: ?"
            << fairness::FairnessEngine::verification_query(result.value())
            << std::endl;
  return 0;
}

int run_simulate(const EngineConfig &config,
                 const std::map<std::string, std::string> &options,
                 bool json_output) {
  uint32_t games = 3;
  std::string chip = "HEART";
  uint32_t seed = 42;
  try {
    if (options.count("games"))
      games = static_cast<uint32_t>(std::stoul(options.at("games")));
    if (options.count("seed"))
      seed = static_cast<uint32_t>(std::stoul(options.at("seed")));
  } catch (const std::exception &e) {
    std::cerr << "❌ Invalid numeric option: " << e.what() << std::endl;
    return 1;
  }
  if (options.count("chip"))
    chip = options.at("chip");

  auto clock = std::make_shared<ManualClock>(SystemClock().now_ms());
  engine::DuelEngine duel_engine(config, clock);
  duel_engine.add_notification_sink(
      std::make_shared<notify::LoggingNotificationSink>());

  const Caller alice{"alice", "Alice"};
  const Caller bob{"bob", "Bob"};
  for (const auto &caller : {alice, bob}) {
    auto registered = duel_engine.register_user(caller.user_id, caller.username, 1000);
    if (registered.is_err()) {
      std::cerr << "❌ Failed to register " << caller.username << ": "
                << registered.error() << std::endl;
      return 1;
    }
  }

  auto print = [&](const std::string &label, const nlohmann::json &reply) {
    if (json_output) {
      std::cout << nlohmann::json{{"step", label}, {"reply", reply}}.dump()
                << std::endl;
    }
    return reply.value("success", false);
  };

  auto created = duel_engine.execute(
      "create_order", alice, {{"chipType", chip}, {"gamesPlanned", games}});
  if (!print("create_order", created)) {
    std::cerr << "❌ " << created.dump() << std::endl;
    return 1;
  }
  const std::string order_id = created["data"]["id"].get<std::string>();

  auto joined = duel_engine.execute("join_order", bob, {{"orderId", order_id}});
  if (!print("join_order", joined)) {
    std::cerr << "❌ " << joined.dump() << std::endl;
    return 1;
  }

  clock->advance(std::chrono::seconds(5));
  auto confirmed =
      duel_engine.execute("confirm_order", alice, {{"orderId", order_id}});
  if (!print("confirm_order", confirmed)) {
    std::cerr << "❌ " << confirmed.dump() << std::endl;
    return 1;
  }
  const std::string match_id = confirmed["data"]["id"].get<std::string>();

  std::mt19937 rng(seed);
  std::uniform_int_distribution<int64_t> numbers(fairness::MIN_PLAYER_NUMBER,
                                                 fairness::MAX_PLAYER_NUMBER);

  for (uint32_t round = 1; round <= games; ++round) {
    for (const auto &caller : {alice, bob}) {
      clock->advance(std::chrono::seconds(2));
      auto submitted = duel_engine.execute(
          "submit", caller,
          {{"matchId", match_id}, {"roundNumber", round},
           {"playerNumber", numbers(rng)}});
      if (!print("submit", submitted)) {
        std::cerr << "❌ " << submitted.dump() << std::endl;
        return 1;
      }
      if (!json_output && submitted["data"].value("bothReady", false)) {
        const auto &game = submitted["data"]["game"];
        std::cout << "Round " << round << ": A=" << game["playerANumber"]
                  << " B=" << game["playerBNumber"]
                  << " random=" << game["fairness"]["randomNumber"]
                  << " seed=" << game["fairness"]["seedSlice"].get<std::string>()
                  << " -> " << game["outcome"].get<std::string>() << "\n";
      }
    }
  }

  duel_engine.flush_notifications();

  auto match = duel_engine.execute("get_match", alice, {{"matchId", match_id}});
  print("get_match", match);
  if (!json_output) {
    const auto &m = match["data"];
    std::cout << "\nSeries " << m["status"].get<std::string>() << ": A "
              << m["winsA"] << " - " << m["winsB"] << " B (" << m["draws"]
              << " draw(s))\n\nLedger:\n";
    for (const auto &caller : {alice, bob}) {
      for (const auto &entry : duel_engine.ledger_for_user(caller.user_id)) {
        std::cout << "  " << caller.username << "  "
                  << transaction_type_name(entry.type) << "  " << entry.amount
                  << "  " << entry.description << "\n";
      }
      auto user = duel_engine.get_user(caller.user_id);
      if (user) {
        std::cout << "  " << caller.username << " balance: "
                  << user->points_balance << "\n";
      }
    }
    std::cout << "Order ledger balance: "
              << duel_engine.order_ledger_balance(order_id) << std::endl;
  }
  return 0;
}

int main(int argc, char *argv[]) {
  std::string command = "simulate";
  int first_option = 1;
  if (argc > 1 && argv[1][0] != '-') {
    command = argv[1];
    first_option = 2;
  }

  std::map<std::string, std::string> options;
  bool json_output = false;
  for (int i = first_option; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--json") {
      json_output = true;
    } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
      options[arg.substr(2)] = argv[++i];
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  EngineConfig config = ConfigManager::create_default();
  if (options.count("config")) {
    auto loaded = ConfigManager::load_from_file(options.at("config"));
    if (!loaded) {
      std::cerr << "Failed to load configuration from " << options.at("config")
                << std::endl;
      return 1;
    }
    config = *loaded;
  }
  if (options.count("secret")) {
    config.platform_secret = options.at("secret");
  }
  if (options.count("log-level")) {
    config.log_level = options.at("log-level");
    for (auto &c : config.log_level) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
  }
  // The series runs synchronously; deliver notifications inline
  config.async_notifications = false;

  std::string error = ConfigManager::validate_config(config);
  if (!error.empty()) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }
  ConfigManager::apply_logging(config);

  try {
    if (command == "simulate") {
      return run_simulate(config, options, json_output);
    } else if (command == "determine") {
      return run_determine(config, options, json_output);
    }
  } catch (const std::exception &e) {
    LOG_CRITICAL_FAILURE("main", "Startup failed", "STARTUP_FAILURE",
                         {{"what", e.what()}});
    std::cerr << "❌ " << e.what() << std::endl;
    return 1;
  }

  std::cerr << "Unknown command: " << command << std::endl;
  print_usage(argv[0]);
  return 1;
}
