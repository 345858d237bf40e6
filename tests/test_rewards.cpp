#include "rewards/calculator.h"
#include <gtest/gtest.h>

using namespace fairduel::common;
using namespace fairduel::rewards;

class RewardCalculatorTest : public ::testing::Test {
protected:
  static SeriesScore score(uint32_t wins_a, uint32_t wins_b, uint32_t draws,
                           uint32_t planned) {
    SeriesScore s;
    s.wins_a = wins_a;
    s.wins_b = wins_b;
    s.draws = draws;
    s.games_played = wins_a + wins_b + draws;
    s.games_planned = planned;
    return s;
  }

  RewardCalculator calculator_;
};

TEST_F(RewardCalculatorTest, LockedBelowMinimum) {
  auto result = calculator_.calculate_match_rewards(score(1, 0, 0, 3), 10);
  EXPECT_EQ(result.kind, SettlementKind::LOCKED);
  EXPECT_FALSE(result.rewards_released);
  EXPECT_TRUE(result.credits.empty());
  EXPECT_FALSE(calculator_.should_release_rewards(1));
  EXPECT_TRUE(calculator_.should_release_rewards(2));
}

TEST_F(RewardCalculatorTest, DecisiveWinnerTakesBothStakes) {
  auto result = calculator_.calculate_match_rewards(score(2, 1, 0, 3), 10);
  EXPECT_EQ(result.kind, SettlementKind::DECISIVE);
  ASSERT_TRUE(result.winner.has_value());
  EXPECT_EQ(*result.winner, Side::A);
  EXPECT_EQ(result.points_transferred, 30);

  ASSERT_EQ(result.credits.size(), 2u);
  EXPECT_EQ(result.credits[0].side, Side::A);
  EXPECT_EQ(result.credits[0].type, TransactionType::STAKE_RETURN);
  EXPECT_EQ(result.credits[0].amount, 30);
  EXPECT_EQ(result.credits[1].type, TransactionType::DUEL_WIN);
  EXPECT_EQ(result.credits[1].amount, 30);
  EXPECT_EQ(RewardCalculator::total_credits(result), 60);
}

TEST_F(RewardCalculatorTest, DrawsDoNotBreakTies) {
  auto result = calculator_.calculate_match_rewards(score(1, 1, 2, 4), 25);
  EXPECT_EQ(result.kind, SettlementKind::DRAW);
  EXPECT_TRUE(result.is_draw);
  EXPECT_FALSE(result.winner.has_value());
  ASSERT_EQ(result.credits.size(), 2u);
  for (const auto &credit : result.credits) {
    EXPECT_EQ(credit.type, TransactionType::STAKE_REFUND);
    EXPECT_EQ(credit.amount, 100);
  }
}

TEST_F(RewardCalculatorTest, StakesFollowGamesPlanned) {
  auto result = calculator_.calculate_match_rewards(score(0, 2, 0, 5), 5);
  ASSERT_TRUE(result.winner.has_value());
  EXPECT_EQ(*result.winner, Side::B);
  EXPECT_EQ(RewardCalculator::total_credits(result), 50);
}

TEST_F(RewardCalculatorTest, ForfeitPaysBothStakesToOpponent) {
  auto result = calculator_.calculate_forfeit(Side::B, 1, 3, 50);
  EXPECT_EQ(result.kind, SettlementKind::FORFEIT);
  ASSERT_TRUE(result.winner.has_value());
  EXPECT_EQ(*result.winner, Side::A);
  ASSERT_EQ(result.credits.size(), 1u);
  EXPECT_EQ(result.credits[0].type, TransactionType::FORFEIT_WIN);
  EXPECT_EQ(result.credits[0].amount, 300);
  EXPECT_EQ(result.points_transferred, 150);
}

TEST_F(RewardCalculatorTest, AbandonmentRefundsBoth) {
  auto result = calculator_.calculate_abandonment(4, 10);
  EXPECT_EQ(result.kind, SettlementKind::ABANDONED);
  EXPECT_TRUE(result.rewards_released);
  EXPECT_EQ(RewardCalculator::total_credits(result), 80);
}

TEST_F(RewardCalculatorTest, ReleasedSettlementsDisposeOfBothStakes) {
  const Points stake = 10;
  for (uint32_t planned = 2; planned <= 10; ++planned) {
    for (uint32_t a = 0; a <= planned; ++a) {
      for (uint32_t b = 0; a + b <= planned; ++b) {
        auto s = score(a, b, planned - a - b, planned);
        auto result = calculator_.calculate_match_rewards(s, stake);
        ASSERT_TRUE(result.rewards_released);
        EXPECT_EQ(RewardCalculator::total_credits(result),
                  2 * stake * static_cast<Points>(planned));
      }
    }
    EXPECT_EQ(RewardCalculator::total_credits(
                  calculator_.calculate_forfeit(Side::A, 0, planned, stake)),
              2 * stake * static_cast<Points>(planned));
  }
}

TEST_F(RewardCalculatorTest, CustomMinimum) {
  RewardCalculator strict(3);
  EXPECT_EQ(strict.calculate_match_rewards(score(2, 0, 0, 4), 10).kind,
            SettlementKind::LOCKED);
  EXPECT_EQ(strict.calculate_match_rewards(score(2, 0, 1, 4), 10).kind,
            SettlementKind::DECISIVE);
}

TEST_F(RewardCalculatorTest, MessagesPerViewer) {
  auto decisive = calculator_.calculate_match_rewards(score(2, 0, 0, 2), 10);
  EXPECT_EQ(RewardCalculator::format_reward_message(decisive, Side::A),
            "You won +20 points!");
  EXPECT_EQ(RewardCalculator::format_reward_message(decisive, Side::B),
            "You lost 20 points.");

  auto draw = calculator_.calculate_match_rewards(score(1, 1, 0, 2), 10);
  EXPECT_EQ(RewardCalculator::format_reward_message(draw, Side::B),
            "Draw! Your stake has been returned.");
}
