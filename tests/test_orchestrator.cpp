#include "matching/order_matcher.h"
#include "orchestrator/match_orchestrator.h"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace fairduel::common;
using namespace fairduel::orchestrator;
using namespace fairduel::storage;
using fairduel::fairness::FairnessEngine;
using fairduel::matching::OrderMatcher;
using fairduel::notify::INotificationSink;
using fairduel::notify::Notification;
using fairduel::notify::NotificationDispatcher;
using fairduel::notify::NotificationType;
using fairduel::reliability::ReliabilityCounters;
using fairduel::reliability::ReliabilityTracker;
using fairduel::scheduling::TimeoutCoordinator;
using fairduel::scheduling::TimeoutKind;

namespace {

const char *kSecret = "orchestrator-test-secret";

class RecordingSink : public INotificationSink {
public:
  void deliver(const Notification &notification) override {
    std::lock_guard<std::mutex> lock(mutex_);
    received_.push_back(notification);
  }
  std::string get_name() const override { return "recording"; }

  size_t count(NotificationType type, const UserId &user) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &item : received_) {
      if (item.type == type && item.user_id == user)
        ++n;
    }
    return n;
  }

private:
  std::mutex mutex_;
  std::vector<Notification> received_;
};

} // namespace

class MatchOrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>(1700000000000);
    store_ = std::make_shared<DuelStore>(clock_);
    notifier_ = std::make_shared<NotificationDispatcher>(false);
    sink_ = std::make_shared<RecordingSink>();
    notifier_->add_sink(sink_);
    timeouts_ = std::make_shared<TimeoutCoordinator>(
        clock_, std::chrono::milliseconds(10));
    config_ = ConfigManager::create_default();

    matcher_ = std::make_unique<OrderMatcher>(store_, config_, notifier_,
                                              timeouts_);
    orchestrator_ = std::make_unique<MatchOrchestrator>(
        store_, config_, std::make_shared<FairnessEngine>(kSecret), notifier_,
        timeouts_);

    timeouts_->register_handler(TimeoutKind::ROUND, [this](const std::string &id) {
      auto handled = orchestrator_->handle_round_timeout(id);
      EXPECT_TRUE(handled.is_ok()) << handled.error();
    });

    for (const auto &caller : {alice_, bob_, carol_}) {
      auto result = store_->transact([&](StoreTransaction &tx) {
        UserRecord user;
        user.id = caller.user_id;
        user.username = caller.username;
        auto inserted = tx.insert_user(user);
        if (inserted.is_err())
          return Result<Points>::from_error(inserted);
        return tx.apply_balance_change(caller.user_id, 1000,
                                       TransactionType::INITIAL_BALANCE,
                                       std::nullopt, std::nullopt, "Initial");
      });
      ASSERT_TRUE(result.is_ok()) << result.error();
    }
  }

  /// alice owns, bob joins; HEART chips (10 points per round)
  MatchId start_series(uint32_t games) {
    auto order = matcher_->create(alice_, ChipType::HEART, games);
    EXPECT_TRUE(order.is_ok()) << order.error();
    order_id_ = order.value().id;
    EXPECT_TRUE(matcher_->join(order_id_, bob_).is_ok());
    auto confirmed = matcher_->confirm(order_id_, alice_);
    EXPECT_TRUE(confirmed.is_ok()) << confirmed.error();
    auto started = orchestrator_->start_match(confirmed.value().match.id);
    EXPECT_TRUE(started.is_ok()) << started.error();
    return started.value().id;
  }

  Result<SubmitResult> submit(const MatchId &match_id, const Caller &caller,
                              int64_t number) {
    auto match = orchestrator_->get_match(match_id);
    return orchestrator_->submit_for_round(match_id, caller,
                                           match->current_round, number);
  }

  void play_round(const MatchId &match_id, int64_t a, int64_t b) {
    ASSERT_TRUE(submit(match_id, alice_, a).is_ok());
    auto second = submit(match_id, bob_, b);
    ASSERT_TRUE(second.is_ok()) << second.error();
    EXPECT_TRUE(second.value().both_ready);
  }

  Points balance(const Caller &caller) const {
    return store_->get_user(caller.user_id)->value.points_balance;
  }

  ReliabilityCounters counters(const Caller &caller) const {
    return store_->get_user(caller.user_id)->value.reliability;
  }

  OrderStatus order_status() const {
    return store_->get_order(order_id_)->value.status;
  }

  void expect_conserved() const {
    EXPECT_EQ(balance(alice_) + balance(bob_), 2000);
    EXPECT_EQ(store_->order_ledger_balance(order_id_), 0);
  }

  const Caller alice_{"alice", "Alice"};
  const Caller bob_{"bob", "Bob"};
  const Caller carol_{"carol", "Carol"};

  std::shared_ptr<ManualClock> clock_;
  std::shared_ptr<DuelStore> store_;
  std::shared_ptr<NotificationDispatcher> notifier_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<TimeoutCoordinator> timeouts_;
  EngineConfig config_;
  std::unique_ptr<OrderMatcher> matcher_;
  std::unique_ptr<MatchOrchestrator> orchestrator_;
  OrderId order_id_;
};

TEST_F(MatchOrchestratorTest, StartOpensFirstRound) {
  const TimestampMs start = clock_->now_ms();
  auto match_id = start_series(3);

  auto match = orchestrator_->get_match(match_id);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->status, MatchStatus::IN_PROGRESS);
  EXPECT_EQ(match->current_round, 1u);
  ASSERT_TRUE(match->current_game_id.has_value());
  EXPECT_EQ(order_status(), OrderStatus::IN_PROGRESS);

  auto game = orchestrator_->get_game(*match->current_game_id);
  ASSERT_TRUE(game.has_value());
  EXPECT_EQ(game->round_number, 1u);
  EXPECT_EQ(game->deadline, start + 300000);
  EXPECT_EQ(game->ceiling_deadline, start + 300000);
  EXPECT_EQ(sink_->count(NotificationType::ROUND_STARTED, "alice"), 1u);
  EXPECT_EQ(sink_->count(NotificationType::ROUND_STARTED, "bob"), 1u);

  // Starting again changes nothing
  auto again = orchestrator_->start_match(match_id);
  ASSERT_TRUE(again.is_ok());
  EXPECT_EQ(again.value().current_game_id, match->current_game_id);
  EXPECT_EQ(orchestrator_->games_for_match(match_id).size(), 1u);
}

TEST_F(MatchOrchestratorTest, FirstSubmissionTightensDeadline) {
  auto match_id = start_series(3);
  clock_->advance(std::chrono::seconds(20));
  const TimestampMs submitted_at = clock_->now_ms();

  auto first = submit(match_id, alice_, 4242);
  ASSERT_TRUE(first.is_ok()) << first.error();
  EXPECT_TRUE(first.value().submitted);
  EXPECT_FALSE(first.value().both_ready);
  EXPECT_EQ(first.value().round_number, 1u);
  EXPECT_EQ(first.value().game.deadline, submitted_at + 10000);

  auto seen_by_bob = orchestrator_->round_status(match_id, bob_);
  ASSERT_TRUE(seen_by_bob.is_ok());
  EXPECT_TRUE(seen_by_bob.value().opponent_submitted);
  EXPECT_FALSE(seen_by_bob.value().opponent_number.has_value());
  EXPECT_FALSE(seen_by_bob.value().my_number.has_value());
  EXPECT_EQ(seen_by_bob.value().deadline, submitted_at + 10000);

  auto seen_by_alice = orchestrator_->round_status(match_id, alice_);
  ASSERT_TRUE(seen_by_alice.is_ok());
  EXPECT_EQ(seen_by_alice.value().my_number, 4242);
  EXPECT_FALSE(seen_by_alice.value().opponent_submitted);

  EXPECT_EQ(orchestrator_->round_status(match_id, carol_).code(),
            ErrorCode::NOT_PARTICIPANT);
}

TEST_F(MatchOrchestratorTest, DeadlineNeverExceedsCeiling) {
  auto match_id = start_series(3);
  const TimestampMs start = clock_->now_ms();
  clock_->advance(std::chrono::milliseconds(295000));

  auto first = submit(match_id, bob_, 1);
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value().game.deadline, start + 300000);
}

TEST_F(MatchOrchestratorTest, RoundCarriesReproducibleFairnessProof) {
  auto match_id = start_series(3);
  clock_->advance(std::chrono::seconds(3));

  ASSERT_TRUE(submit(match_id, bob_, 777777).is_ok());
  auto second = submit(match_id, alice_, 123456);
  ASSERT_TRUE(second.is_ok());
  ASSERT_TRUE(second.value().both_ready);

  const GameRecord &game = second.value().game;
  EXPECT_EQ(game.status, GameStatus::FINISHED);
  EXPECT_EQ(game.seed_slice.size(), 8u);

  fairduel::fairness::RoundParams params;
  params.duel_id = match_id;
  params.round_number = 1;
  params.time_slot = fairduel::fairness::calculate_time_slot(clock_->now_ms());
  params.player_a = {"alice", 123456};
  params.player_b = {"bob", 777777};
  auto expected = FairnessEngine(kSecret).determine_winner(params);
  ASSERT_TRUE(expected.is_ok());

  EXPECT_EQ(game.time_slot, params.time_slot);
  EXPECT_EQ(game.seed_slice, expected.value().seed_slice);
  EXPECT_EQ(game.random_number, expected.value().random_number);
  EXPECT_EQ(game.winner_id, expected.value().winner_id);

  auto verified = FairnessEngine::verify_result(
      game.seed_slice, 123456, 777777, expected.value().winner);
  ASSERT_TRUE(verified.is_ok());
  EXPECT_TRUE(verified.value().is_valid);

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->games_played, 1u);
  EXPECT_EQ(match->current_round, 2u);
  EXPECT_EQ(match->wins_a + match->wins_b + match->draws, 1u);
  EXPECT_EQ(sink_->count(NotificationType::ROUND_RESULT, "alice"), 1u);

  auto games = orchestrator_->games_for_match(match_id);
  ASSERT_EQ(games.size(), 2u);
  EXPECT_EQ(games[0].round_number, 1u);
  EXPECT_EQ(games[1].round_number, 2u);
}

TEST_F(MatchOrchestratorTest, SubmissionRejections) {
  auto match_id = start_series(3);

  EXPECT_EQ(submit(match_id, alice_, 1000000).code(), ErrorCode::VALIDATION);
  EXPECT_EQ(submit(match_id, alice_, -1).code(), ErrorCode::VALIDATION);
  EXPECT_EQ(submit(match_id, carol_, 5).code(), ErrorCode::NOT_PARTICIPANT);
  EXPECT_EQ(orchestrator_->submit_for_round(match_id, alice_, 2, 5).code(),
            ErrorCode::STATE_CONFLICT);
  EXPECT_EQ(orchestrator_->submit_for_round("match_missing", alice_, 1, 5).code(),
            ErrorCode::NOT_FOUND);
  EXPECT_EQ(orchestrator_->submit_player_number("game_missing", alice_, 5).code(),
            ErrorCode::NOT_FOUND);

  ASSERT_TRUE(submit(match_id, alice_, 5).is_ok());
  EXPECT_EQ(submit(match_id, alice_, 6).code(), ErrorCode::ALREADY_SUBMITTED);
}

TEST_F(MatchOrchestratorTest, AllDrawSeriesIsNetZero) {
  auto match_id = start_series(3);
  EXPECT_EQ(balance(alice_), 970);
  EXPECT_EQ(balance(bob_), 970);

  for (int round = 0; round < 3; ++round) {
    play_round(match_id, 500000, 500000);
  }

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::COMPLETED);
  EXPECT_EQ(match->draws, 3u);
  EXPECT_FALSE(match->winner_id.has_value());
  EXPECT_EQ(order_status(), OrderStatus::COMPLETED);

  EXPECT_EQ(balance(alice_), 1000);
  EXPECT_EQ(balance(bob_), 1000);
  expect_conserved();

  auto refunds = store_->select_ledger([&](const LedgerEntry &e) {
    return e.related_order_id == order_id_ &&
           e.type == TransactionType::STAKE_REFUND;
  });
  EXPECT_EQ(refunds.size(), 2u);

  EXPECT_EQ(counters(alice_).completed_deals, 1u);
  EXPECT_EQ(counters(bob_).completed_deals, 1u);
  EXPECT_EQ(sink_->count(NotificationType::SERIES_COMPLETED, "bob"), 1u);

  auto stats = orchestrator_->user_stats("alice");
  ASSERT_TRUE(stats.is_ok());
  EXPECT_EQ(stats.value().matches_played, 1u);
  EXPECT_EQ(stats.value().draws, 1u);
  EXPECT_EQ(stats.value().net_points, 0);
  EXPECT_EQ(stats.value().balance, 1000);

  // Nothing more to submit
  EXPECT_EQ(orchestrator_->submit_for_round(match_id, alice_, 3, 1).code(),
            ErrorCode::ALREADY_SUBMITTED);
}

// Ids come from the store counter and the clock stays in slot 56666666,
// so the seeds are match_7:<round>:56666666:alice:<a>:bob:<b>. Random
// numbers 987495, 572560 and 151390 give bob rounds 1 and 2.
TEST_F(MatchOrchestratorTest, DecidedSeriesPaysWinner) {
  auto match_id = start_series(3);
  ASSERT_EQ(match_id, "match_7");
  play_round(match_id, 100000, 900000);
  play_round(match_id, 250000, 750000);
  play_round(match_id, 10, 999990);

  auto games = orchestrator_->games_for_match(match_id);
  ASSERT_EQ(games.size(), 3u);
  EXPECT_EQ(games[0].random_number, 987495u);
  EXPECT_EQ(games[1].random_number, 572560u);
  EXPECT_EQ(games[2].random_number, 151390u);

  auto match = orchestrator_->get_match(match_id);
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->status, MatchStatus::COMPLETED);
  EXPECT_EQ(match->games_played, 3u);
  EXPECT_EQ(match->wins_a, 1u);
  EXPECT_EQ(match->wins_b, 2u);
  EXPECT_EQ(match->draws, 0u);
  EXPECT_EQ(match->winner_id, std::optional<UserId>("bob"));

  EXPECT_EQ(balance(alice_), 970);
  EXPECT_EQ(balance(bob_), 1030);
  expect_conserved();

  auto wins = store_->select_ledger([&](const LedgerEntry &e) {
    return e.related_order_id == order_id_ &&
           e.type == TransactionType::DUEL_WIN;
  });
  ASSERT_EQ(wins.size(), 1u);
  EXPECT_EQ(wins[0].user_id, "bob");
  EXPECT_EQ(wins[0].amount, 30);
  ASSERT_TRUE(wins[0].related_match_id.has_value());
  EXPECT_EQ(*wins[0].related_match_id, match_id);
}

TEST_F(MatchOrchestratorTest, ForfeitBeforeMinimumPaysBothStakes) {
  auto match_id = start_series(3);
  const double bob_before =
      ReliabilityTracker::coefficient(counters(bob_));

  ASSERT_TRUE(submit(match_id, alice_, 31337).is_ok());
  clock_->advance(std::chrono::milliseconds(10000));
  timeouts_->run_due();
  EXPECT_EQ(orchestrator_->get_match(match_id)->status, MatchStatus::IN_PROGRESS);

  clock_->advance(std::chrono::milliseconds(1));
  timeouts_->run_due();

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::FORFEITED);
  ASSERT_TRUE(match->winner_id.has_value());
  EXPECT_EQ(*match->winner_id, "alice");
  EXPECT_EQ(match->games_played, 0u);

  auto game = orchestrator_->get_game(*match->current_game_id);
  EXPECT_EQ(game->outcome, GameOutcome::FORFEITED_B);
  EXPECT_EQ(game->status, GameStatus::FINISHED);

  EXPECT_EQ(balance(alice_), 1030);
  EXPECT_EQ(balance(bob_), 970);
  expect_conserved();
  EXPECT_EQ(order_status(), OrderStatus::COMPLETED);

  auto payout = store_->select_ledger([&](const LedgerEntry &e) {
    return e.type == TransactionType::FORFEIT_WIN;
  });
  ASSERT_EQ(payout.size(), 1u);
  EXPECT_EQ(payout[0].user_id, "alice");
  EXPECT_EQ(payout[0].amount, 60);

  EXPECT_LT(ReliabilityTracker::coefficient(counters(bob_)), bob_before);
  EXPECT_EQ(counters(bob_).dropped_before_min_games, 1u);
  EXPECT_EQ(counters(alice_).completed_deals, 1u);
  EXPECT_EQ(sink_->count(NotificationType::OPPONENT_FORFEITED, "alice"), 1u);

  // The ceiling entry still queued for this round is a no-op
  clock_->advance(std::chrono::minutes(10));
  timeouts_->run_due();
  EXPECT_EQ(balance(alice_), 1030);
}

TEST_F(MatchOrchestratorTest, LateSubmissionIsExpiredAndForfeits) {
  auto match_id = start_series(2);
  ASSERT_TRUE(submit(match_id, bob_, 10).is_ok());
  clock_->advance(std::chrono::milliseconds(10001));

  auto late = submit(match_id, alice_, 20);
  EXPECT_EQ(late.code(), ErrorCode::EXPIRED);

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::FORFEITED);
  EXPECT_EQ(match->winner_id, std::optional<UserId>("bob"));
  EXPECT_EQ(balance(bob_), 1020);
  EXPECT_EQ(balance(alice_), 980);
  expect_conserved();
}

TEST_F(MatchOrchestratorTest, BothAbsentBeforeMinimumRefundsBoth) {
  auto match_id = start_series(4);
  clock_->advance(std::chrono::milliseconds(300001));
  timeouts_->run_due();

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::BOTH_ABANDONED);
  EXPECT_FALSE(match->winner_id.has_value());
  EXPECT_EQ(orchestrator_->get_game(*match->current_game_id)->outcome,
            GameOutcome::ABANDONED);
  EXPECT_EQ(order_status(), OrderStatus::CANCELLED);

  EXPECT_EQ(balance(alice_), 1000);
  EXPECT_EQ(balance(bob_), 1000);
  expect_conserved();
  EXPECT_EQ(counters(alice_).dropped_before_min_games, 1u);
  EXPECT_EQ(counters(bob_).dropped_before_min_games, 1u);
}

TEST_F(MatchOrchestratorTest, MissedRoundAfterMinimumCostsOnlyThatRound) {
  auto match_id = start_series(3);
  play_round(match_id, 42, 42);
  play_round(match_id, 43, 43);

  ASSERT_TRUE(submit(match_id, alice_, 44).is_ok());
  clock_->advance(std::chrono::milliseconds(10001));
  timeouts_->run_due();

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::COMPLETED);
  EXPECT_EQ(match->games_played, 3u);
  EXPECT_EQ(match->draws, 2u);
  EXPECT_EQ(match->wins_a, 1u);
  EXPECT_EQ(match->winner_id, std::optional<UserId>("alice"));

  EXPECT_EQ(balance(alice_), 1030);
  EXPECT_EQ(balance(bob_), 970);
  expect_conserved();
  EXPECT_EQ(counters(bob_).dropped_before_min_games, 0u);
  EXPECT_EQ(counters(bob_).completed_deals, 1u);
}

TEST_F(MatchOrchestratorTest, MissedRoundAfterMinimumContinuesSeries) {
  auto match_id = start_series(4);
  play_round(match_id, 42, 42);
  play_round(match_id, 43, 43);

  ASSERT_TRUE(submit(match_id, bob_, 44).is_ok());
  clock_->advance(std::chrono::milliseconds(10001));
  timeouts_->run_due();

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::IN_PROGRESS);
  EXPECT_EQ(match->wins_b, 1u);
  EXPECT_EQ(match->current_round, 4u);
  EXPECT_EQ(store_->order_ledger_balance(order_id_), -80);
}

TEST_F(MatchOrchestratorTest, BothAbsentAfterMinimumSettlesPlayedRounds) {
  auto match_id = start_series(4);
  play_round(match_id, 7, 7);
  play_round(match_id, 8, 8);

  clock_->advance(std::chrono::milliseconds(300001));
  timeouts_->run_due();

  auto match = orchestrator_->get_match(match_id);
  EXPECT_EQ(match->status, MatchStatus::COMPLETED);
  EXPECT_EQ(match->games_played, 2u);
  EXPECT_EQ(order_status(), OrderStatus::COMPLETED);
  EXPECT_EQ(balance(alice_), 1000);
  EXPECT_EQ(balance(bob_), 1000);
  expect_conserved();
  EXPECT_EQ(counters(alice_).completed_deals, 1u);
  EXPECT_EQ(counters(alice_).dropped_before_min_games, 0u);
}

TEST_F(MatchOrchestratorTest, TimeoutBeforeDeadlineIsNoOp) {
  auto match_id = start_series(3);
  auto game_id = *orchestrator_->get_match(match_id)->current_game_id;

  auto early = orchestrator_->handle_round_timeout(game_id);
  ASSERT_TRUE(early.is_ok());
  EXPECT_EQ(early.value().status, GameStatus::AWAITING_NUMBERS);
  EXPECT_EQ(orchestrator_->handle_round_timeout("game_missing").code(),
            ErrorCode::NOT_FOUND);
}

TEST_F(MatchOrchestratorTest, StartRequiresMatchedOrder) {
  EXPECT_EQ(orchestrator_->start_match("match_missing").code(),
            ErrorCode::NOT_FOUND);
  EXPECT_THROW(
      {
        MatchOrchestrator orchestrator(store_, config_, nullptr, notifier_,
                                       timeouts_);
      },
      std::invalid_argument);
}

TEST_F(MatchOrchestratorTest, MatchesListedForParticipants) {
  auto first = start_series(2);
  clock_->advance(std::chrono::seconds(1));
  auto second = start_series(2);

  auto matches = orchestrator_->matches_for_user("bob");
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].id, second);
  EXPECT_EQ(matches[1].id, first);
  EXPECT_TRUE(orchestrator_->matches_for_user("carol").empty());
}

// Both players and the timeout sweeper race on every round; each round must
// be resolved by exactly one of the two submissions.
TEST_F(MatchOrchestratorTest, ConcurrentSubmissionsResolveOnce) {
  constexpr int kSeries = 20;
  const auto settles_order = [this](const LedgerEntry &e) {
    return e.related_order_id == order_id_ &&
           (e.type == TransactionType::STAKE_RETURN ||
            e.type == TransactionType::DUEL_WIN ||
            e.type == TransactionType::STAKE_REFUND ||
            e.type == TransactionType::FORFEIT_WIN);
  };

  for (int series = 0; series < kSeries; ++series) {
    auto match_id = start_series(2);

    for (uint32_t round = 1; round <= 2; ++round) {
      std::atomic<bool> go{false};
      Result<SubmitResult> from_alice(ErrorCode::INTERNAL, "not run");
      Result<SubmitResult> from_bob(ErrorCode::INTERNAL, "not run");
      const auto wait_for_go = [&go] {
        while (!go.load())
          std::this_thread::yield();
      };

      std::vector<std::thread> workers;
      workers.emplace_back([&] {
        wait_for_go();
        from_alice = orchestrator_->submit_for_round(match_id, alice_, round,
                                                     400000 + series);
      });
      workers.emplace_back([&] {
        wait_for_go();
        from_bob = orchestrator_->submit_for_round(match_id, bob_, round,
                                                   600000 - series);
      });
      workers.emplace_back([&] {
        wait_for_go();
        timeouts_->run_due();
      });
      go.store(true);
      for (auto &worker : workers)
        worker.join();

      ASSERT_TRUE(from_alice.is_ok()) << from_alice.error();
      ASSERT_TRUE(from_bob.is_ok()) << from_bob.error();
      EXPECT_NE(from_alice.value().both_ready, from_bob.value().both_ready)
          << "series " << series << " round " << round;

      auto match = orchestrator_->get_match(match_id);
      ASSERT_TRUE(match.has_value());
      EXPECT_EQ(match->games_played, round);
    }

    auto match = orchestrator_->get_match(match_id);
    EXPECT_EQ(match->status, MatchStatus::COMPLETED);
    EXPECT_EQ(orchestrator_->games_for_match(match_id).size(), 2u);
    EXPECT_EQ(store_->order_ledger_balance(order_id_), 0);
    EXPECT_EQ(store_->select_ledger(settles_order).size(), 2u);

    const size_t resolved_rounds = 2u * static_cast<size_t>(series + 1);
    EXPECT_EQ(sink_->count(NotificationType::ROUND_RESULT, "alice"),
              resolved_rounds);
    EXPECT_EQ(sink_->count(NotificationType::ROUND_RESULT, "bob"),
              resolved_rounds);
    EXPECT_EQ(sink_->count(NotificationType::SERIES_COMPLETED, "alice"),
              static_cast<size_t>(series + 1));
  }
  EXPECT_EQ(balance(alice_) + balance(bob_), 2000);
}

// A late submission racing two sweepers past the deadline forfeits once.
TEST_F(MatchOrchestratorTest, ConcurrentTimeoutForfeitsOnce) {
  constexpr int kSeries = 10;
  for (int series = 0; series < kSeries; ++series) {
    auto match_id = start_series(3);
    ASSERT_TRUE(submit(match_id, alice_, 31337).is_ok());
    clock_->advance(std::chrono::milliseconds(10001));

    std::atomic<bool> go{false};
    Result<SubmitResult> late(ErrorCode::INTERNAL, "not run");
    const auto wait_for_go = [&go] {
      while (!go.load())
        std::this_thread::yield();
    };

    std::vector<std::thread> workers;
    workers.emplace_back([&] {
      wait_for_go();
      late = orchestrator_->submit_for_round(match_id, bob_, 1, 42);
    });
    for (int sweeper = 0; sweeper < 2; ++sweeper) {
      workers.emplace_back([&] {
        wait_for_go();
        timeouts_->run_due();
      });
    }
    go.store(true);
    for (auto &worker : workers)
      worker.join();

    EXPECT_TRUE(late.is_err());
    EXPECT_TRUE(is_state_conflict(late.code())) << late.error();

    auto match = orchestrator_->get_match(match_id);
    EXPECT_EQ(match->status, MatchStatus::FORFEITED);
    EXPECT_EQ(match->winner_id, std::optional<UserId>("alice"));
    EXPECT_EQ(store_->order_ledger_balance(order_id_), 0);

    auto payouts = store_->select_ledger([this](const LedgerEntry &e) {
      return e.related_order_id == order_id_ &&
             e.type == TransactionType::FORFEIT_WIN;
    });
    ASSERT_EQ(payouts.size(), 1u);
    EXPECT_EQ(payouts[0].amount, 60);

    const auto settled = static_cast<uint64_t>(series + 1);
    EXPECT_EQ(counters(bob_).dropped_before_min_games, settled);
    EXPECT_EQ(counters(alice_).completed_deals, settled);
    EXPECT_EQ(sink_->count(NotificationType::OPPONENT_FORFEITED, "alice"),
              static_cast<size_t>(series + 1));
  }
  EXPECT_EQ(balance(alice_), 1000 + 30 * kSeries);
  EXPECT_EQ(balance(bob_), 1000 - 30 * kSeries);
}
