#include "engine/dto.h"
#include "fairness/fairness_engine.h"
#include <iostream>
#include <string>

using namespace fairduel;

void print_usage() {
  std::cout << "Fairduel Public Round Verifier\n";
  std::cout << "Usage: fairduel-verify --seed-slice HEX --a NUM --b NUM "
               "[options]\n\n";
  std::cout << "Recomputes a round result from its published seed slice. "
               "No platform secret is needed.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --seed-slice HEX   8 hex characters published with the round\n";
  std::cout << "  --a NUM            Player A number (0-999999)\n";
  std::cout << "  --b NUM            Player B number (0-999999)\n";
  std::cout << "  --claimed WINNER   Claimed winner: A, B or DRAW (default: DRAW)\n";
  std::cout << "  --json             Print the result as JSON\n";
  std::cout << "  --help             Show this help message\n";
}

bool parse_number(const std::string &text, int64_t &out) {
  try {
    size_t used = 0;
    long long value = std::stoll(text, &used);
    if (used != text.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

int main(int argc, char *argv[]) {
  std::string seed_slice;
  std::string a_text;
  std::string b_text;
  std::string claimed_text = "DRAW";
  bool json_output = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--seed-slice" && i + 1 < argc) {
      seed_slice = argv[++i];
    } else if (arg == "--a" && i + 1 < argc) {
      a_text = argv[++i];
    } else if (arg == "--b" && i + 1 < argc) {
      b_text = argv[++i];
    } else if (arg == "--claimed" && i + 1 < argc) {
      claimed_text = argv[++i];
    } else if (arg == "--json") {
      json_output = true;
    } else if (arg == "--help") {
      print_usage();
      return 0;
    } else {
      std::cerr << "❌ Unknown option: " << arg << std::endl;
      print_usage();
      return 1;
    }
  }

  if (seed_slice.empty() || a_text.empty() || b_text.empty()) {
    print_usage();
    return 1;
  }

  int64_t a = 0;
  int64_t b = 0;
  if (!parse_number(a_text, a) || !parse_number(b_text, b)) {
    std::cerr << "❌ Player numbers must be integers" << std::endl;
    return 1;
  }

  auto claimed = fairness::parse_winner(claimed_text);
  if (!claimed) {
    std::cerr << "❌ Claimed winner must be A, B or DRAW" << std::endl;
    return 1;
  }

  auto result = fairness::FairnessEngine::verify_result(seed_slice, a, b, *claimed);
  if (result.is_err()) {
    if (json_output) {
      std::cout << engine::error_envelope(result).dump(2) << std::endl;
    } else {
      std::cerr << "❌ Verification failed: " << result.error() << std::endl;
    }
    return 2;
  }

  const auto &verification = result.value();
  if (json_output) {
    std::cout << engine::success_envelope(engine::to_json(verification)).dump(2)
              << std::endl;
  } else {
    std::cout << "Seed slice:     " << seed_slice << "\n";
    std::cout << "Random number:  " << verification.random_number << "\n";
    std::cout << "Distance A:     |" << a << " - " << verification.random_number
              << "| = " << verification.distance_a << "\n";
    std::cout << "Distance B:     |" << b << " - " << verification.random_number
              << "| = " << verification.distance_b << "\n";
    std::cout << "Expected:       "
              << fairness::winner_name(verification.expected_winner) << "\n";
    std::cout << (verification.is_valid ? "✅ " : "❌ ") << verification.message
              << std::endl;
  }
  return verification.is_valid ? 0 : 3;
}
