#include "common/chips.h"
#include <algorithm>
#include <cctype>

namespace fairduel {
namespace common {

Points chip_value(ChipType type) noexcept {
  for (const auto &config : CHIP_CONFIGS) {
    if (config.type == type)
      return config.points_value;
  }
  return 0;
}

const char *chip_name(ChipType type) noexcept {
  for (const auto &config : CHIP_CONFIGS) {
    if (config.type == type)
      return config.name;
  }
  return "UNKNOWN";
}

std::optional<ChipType> parse_chip_type(const std::string &input) {
  std::string normalized = input;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  for (const auto &config : CHIP_CONFIGS) {
    if (normalized == config.name)
      return config.type;
  }
  return std::nullopt;
}

} // namespace common
} // namespace fairduel
