#pragma once

#include "common/types.h"
#include <array>
#include <optional>
#include <string>

namespace fairduel {
namespace common {

/**
 * @brief Named stake tiers
 *
 * Each chip maps to a fixed number of points staked per round.
 */
enum class ChipType { SMILE, HEART, FIRE, RING };

struct ChipConfig {
  ChipType type;
  const char *name;
  Points points_value;
};

constexpr std::array<ChipConfig, 4> CHIP_CONFIGS = {{
    {ChipType::SMILE, "SMILE", 5},
    {ChipType::HEART, "HEART", 10},
    {ChipType::FIRE, "FIRE", 25},
    {ChipType::RING, "RING", 50},
}};

Points chip_value(ChipType type) noexcept;
const char *chip_name(ChipType type) noexcept;

/// Case-insensitive; nullopt for anything outside the chip table
std::optional<ChipType> parse_chip_type(const std::string &input);

/// Points a single player escrows for a whole series
inline Points calculate_total_stake(ChipType type, uint32_t games_planned) {
  return chip_value(type) * static_cast<Points>(games_planned);
}

} // namespace common
} // namespace fairduel
