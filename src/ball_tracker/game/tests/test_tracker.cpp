#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

extern "C" {
#include "ball_tracker/bt_tracker.h"
#include "ball_tracker/common/bt_common.h"
}

#include "ball_tracker/game/bt_tracker_internals.hpp"

namespace fs = std::filesystem;

using bt::AttemptResult;
using bt::Ball;
using bt::TrackerGame;
using bt::TrackerState;
using bt::UserProfile;
using bt::Vec2;

namespace {

constexpr std::uint32_t kUser = 1;

// Хранилище в памяти: считает записи, ничего не пишет на диск
class MemoryStore final : public bt::ProfileStore {
 public:
  std::map<std::uint32_t, UserProfile> profiles;
  int best_saves = 0;
  int history_saves = 0;

  bool exists(std::uint32_t user_id) const noexcept override {
    return profiles.count(user_id) != 0;
  }

  bool claim(std::uint32_t user_id) noexcept override {
    if (exists(user_id)) return false;
    profiles[user_id].user_id = user_id;
    return true;
  }

  std::optional<UserProfile> load(std::uint32_t user_id) const override {
    auto it = profiles.find(user_id);
    if (it == profiles.end()) return std::nullopt;
    return it->second;
  }

  bool saveBest(std::uint32_t user_id, std::uint32_t level) noexcept override {
    ++best_saves;
    profiles[user_id].personal_best = level;
    return true;
  }

  bool saveHistory(std::uint32_t user_id,
                   const std::vector<AttemptResult>& history) noexcept override {
    ++history_saves;
    profiles[user_id].history = history;
    return true;
  }
};

class TrackerTest : public ::testing::Test {
 protected:
  std::uint64_t now = 10000;
  MemoryStore* store = nullptr;
  std::unique_ptr<TrackerGame> game;

  void SetUp() override {
    auto memory = std::make_unique<MemoryStore>();
    store = memory.get();
    ASSERT_TRUE(memory->claim(kUser));

    UserProfile profile;
    profile.user_id = kUser;
    game = std::make_unique<TrackerGame>(
        bt::Ledger(std::move(memory), profile), [this] { return now; }, 2024u);
  }

  void Advance(std::uint64_t ms) {
    now += ms;
    game->tick();
  }

  void ToTracking() {
    game->handleInput(Start);
    Advance(BT_REVEAL_DELAY_MS);
    ASSERT_EQ(game->state(), TrackerState::TRACKING);
  }

  void ToAwaiting() {
    ToTracking();
    Advance(BT_TRACKING_DURATION_MS);
    ASSERT_EQ(game->state(), TrackerState::AWAITING_INPUT);
    SpreadBalls();
  }

  // Шары на сетке без перекрытий, чтобы щелчок попадал ровно в один шар
  void SpreadBalls() {
    auto& balls = game->balls_for_testing();
    for (std::size_t i = 0; i < balls.size(); ++i) {
      balls[i].position = Vec2(40.0 + 60.0 * static_cast<double>(i % 5),
                               40.0 + 60.0 * static_cast<double>(i / 5));
    }
  }

  Vec2 NthBall(bool target, std::size_t n = 0) {
    std::size_t seen = 0;
    for (const Ball& b : game->balls_for_testing()) {
      if (b.is_target == target && seen++ == n) return b.position;
    }
    ADD_FAILURE() << "no such ball";
    return Vec2();
  }

  void CompleteLevel() {
    ToAwaiting();
    const std::uint32_t targets = game->config().target_count;
    for (std::uint32_t i = 0; i < targets; ++i) {
      game->handleTap(NthBall(true, i));
    }
    ASSERT_EQ(game->outcome(), OUTCOME_CORRECT);
  }

  int CountVisual(BallVisual_t visual) {
    int n = 0;
    for (const Ball& b : game->balls_for_testing())
      if (b.visual == visual) ++n;
    return n;
  }
};

}  // namespace

/* ===== Начальное состояние ===== */

TEST_F(TrackerTest, StartsIdle) {
  EXPECT_EQ(game->state(), TrackerState::IDLE);
  EXPECT_EQ(game->outcome(), OUTCOME_NONE);
  EXPECT_TRUE(game->startEnabled());
  EXPECT_FALSE(game->motionActive());

  const TrackerInfo_t& info = game->info();
  EXPECT_EQ(info.phase, PHASE_IDLE);
  EXPECT_EQ(info.ball_count, 0);
  EXPECT_EQ(info.level, 1);
  EXPECT_EQ(info.personal_best, 0);
  EXPECT_STREQ(info.start_label, "Start Level");
  EXPECT_TRUE(bt_is_valid_info(&info));
}

TEST_F(TrackerTest, IdleTicksDoNothing) {
  Advance(100000);
  EXPECT_EQ(game->state(), TrackerState::IDLE);
  EXPECT_EQ(game->pending_timers_for_testing(), 0u);
}

/* ===== Последовательность фаз ===== */

TEST_F(TrackerTest, StartGoesStraightToReveal) {
  game->handleInput(Start);
  EXPECT_EQ(game->state(), TrackerState::REVEAL);
  EXPECT_FALSE(game->startEnabled());
  EXPECT_FALSE(game->motionActive());

  ASSERT_EQ(game->balls_for_testing().size(), 3u);
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 1);
  EXPECT_EQ(CountVisual(BALL_NEUTRAL), 2);
  EXPECT_STREQ(game->info().message, "Watch the 1 highlighted ball(s).");
  EXPECT_TRUE(bt_is_valid_info(&game->info()));
}

TEST_F(TrackerTest, RevealLastsExactly) {
  game->handleInput(Start);
  Advance(BT_REVEAL_DELAY_MS - 1);
  EXPECT_EQ(game->state(), TrackerState::REVEAL);
  Advance(1);
  EXPECT_EQ(game->state(), TrackerState::TRACKING);
}

TEST_F(TrackerTest, TrackingHidesTargetsAndMoves) {
  ToTracking();
  EXPECT_TRUE(game->motionActive());
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 0);
  EXPECT_EQ(CountVisual(BALL_NEUTRAL), 3);

  Vec2 before = game->balls_for_testing()[0].position;
  Advance(16);
  Vec2 after = game->balls_for_testing()[0].position;
  EXPECT_TRUE(before.x != after.x || before.y != after.y);
  EXPECT_TRUE(bt_is_valid_info(&game->info()));
}

TEST_F(TrackerTest, TrackingLastsExactly) {
  ToTracking();
  Advance(BT_TRACKING_DURATION_MS - 1);
  EXPECT_EQ(game->state(), TrackerState::TRACKING);
  Advance(1);
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  EXPECT_STREQ(game->info().message, "Click the 1 ball(s) you were tracking.");
}

TEST_F(TrackerTest, MotionStopsWhenTrackingEnds) {
  ToTracking();
  Advance(BT_TRACKING_DURATION_MS);
  EXPECT_FALSE(game->motionActive());

  std::vector<Vec2> frozen;
  for (const Ball& b : game->balls_for_testing()) frozen.push_back(b.position);
  for (int i = 0; i < 30; ++i) Advance(16);
  for (std::size_t i = 0; i < frozen.size(); ++i) {
    EXPECT_DOUBLE_EQ(game->balls_for_testing()[i].position.x, frozen[i].x);
    EXPECT_DOUBLE_EQ(game->balls_for_testing()[i].position.y, frozen[i].y);
  }
}

/* ===== Успешная попытка ===== */

TEST_F(TrackerTest, CorrectPickAdvancesLevel) {
  ToAwaiting();
  now += 840;
  game->handleTap(NthBall(true));

  EXPECT_EQ(game->state(), TrackerState::RESOLVED);
  EXPECT_EQ(game->outcome(), OUTCOME_CORRECT);
  EXPECT_EQ(game->foundTargets(), 1u);
  EXPECT_EQ(CountVisual(BALL_CORRECT), 1);

  ASSERT_EQ(game->ledger().history().size(), 1u);
  EXPECT_EQ(game->ledger().history()[0], (AttemptResult{1, 0.84, true}));
  EXPECT_EQ(game->ledger().personalBest(), 1u);
  EXPECT_EQ(store->profiles[kUser].personal_best, 1u);
  EXPECT_EQ(store->profiles[kUser].history.size(), 1u);

  EXPECT_EQ(game->config(), (bt::LevelConfig{2, 4, 2, 2.0}));
  EXPECT_TRUE(game->startEnabled());
  EXPECT_STREQ(game->info().start_label, "Next Level");
  EXPECT_STREQ(game->info().message, "Correct! Well done!");
  EXPECT_TRUE(bt_is_valid_info(&game->info()));
}

TEST_F(TrackerTest, NextLevelUsesNewConfig) {
  CompleteLevel();
  game->handleInput(Start);
  EXPECT_EQ(game->state(), TrackerState::REVEAL);
  EXPECT_EQ(game->balls_for_testing().size(), 4u);
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 2);
  EXPECT_EQ(game->foundTargets(), 0u);
  EXPECT_EQ(game->info().level, 2);
}

TEST_F(TrackerTest, PartialFindWaitsForRemaining) {
  CompleteLevel();
  ToAwaiting();
  ASSERT_EQ(game->config().target_count, 2u);

  game->handleTap(NthBall(true, 0));
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  EXPECT_EQ(game->foundTargets(), 1u);
  EXPECT_STREQ(game->info().message, "Good job! Find the remaining 1 ball(s).");

  // повторный щелчок по найденному шару ничего не меняет
  game->handleTap(NthBall(true, 0));
  EXPECT_EQ(game->foundTargets(), 1u);
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);

  game->handleTap(NthBall(true, 1));
  EXPECT_EQ(game->outcome(), OUTCOME_CORRECT);
  EXPECT_EQ(game->ledger().personalBest(), 2u);
  EXPECT_EQ(game->config().level, 3u);
  EXPECT_DOUBLE_EQ(game->config().speed, 2.25);
}

/* ===== Ошибка и отказ ===== */

TEST_F(TrackerTest, LoseTrackRecordsTrackingTime) {
  ToTracking();
  Advance(3420);
  game->handleInput(LoseTrack);

  EXPECT_EQ(game->state(), TrackerState::RESOLVED);
  EXPECT_EQ(game->outcome(), OUTCOME_GAVE_UP);
  EXPECT_FALSE(game->motionActive());
  ASSERT_EQ(game->ledger().history().size(), 1u);
  EXPECT_EQ(game->ledger().history()[0], (AttemptResult{1, 3.42, false}));

  EXPECT_EQ(game->config(), bt::startConfig()) << "retry keeps the level";
  EXPECT_EQ(game->ledger().personalBest(), 0u);
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 1) << "targets are revealed";
  EXPECT_STREQ(game->info().start_label, "Try Again");
  EXPECT_STREQ(game->info().message, "Tracked for 3.4s. Let's see the answer.");
  EXPECT_TRUE(bt_is_valid_info(&game->info()));
}

TEST_F(TrackerTest, WrongPickRevealsAndRecordsNothing) {
  ToAwaiting();
  game->handleTap(NthBall(false));

  EXPECT_EQ(game->state(), TrackerState::RESOLVED);
  EXPECT_EQ(game->outcome(), OUTCOME_INCORRECT);
  EXPECT_EQ(CountVisual(BALL_INCORRECT), 1);
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 1);
  EXPECT_TRUE(game->ledger().history().empty());
  EXPECT_EQ(store->history_saves, 0);
  EXPECT_EQ(game->config(), bt::startConfig());
  EXPECT_STREQ(game->info().message, "Incorrect. Try this level again.");
  EXPECT_STREQ(game->info().start_label, "Try Again");
}

TEST_F(TrackerTest, WrongPickAfterPartialFindRevealsAllTargets) {
  CompleteLevel();
  ToAwaiting();
  game->handleTap(NthBall(true, 0));
  game->handleTap(NthBall(false));

  EXPECT_EQ(game->outcome(), OUTCOME_INCORRECT);
  EXPECT_EQ(CountVisual(BALL_HIGHLIGHTED), 2);
  EXPECT_EQ(CountVisual(BALL_CORRECT), 0);
  EXPECT_EQ(game->ledger().history().size(), 1u) << "only the level 1 win";
}

TEST_F(TrackerTest, RetryRegeneratesSameLevel) {
  ToAwaiting();
  game->handleTap(NthBall(false));
  game->handleInput(Start);

  EXPECT_EQ(game->state(), TrackerState::REVEAL);
  EXPECT_EQ(game->outcome(), OUTCOME_NONE);
  EXPECT_EQ(game->foundTargets(), 0u);
  EXPECT_EQ(CountVisual(BALL_INCORRECT), 0);
  EXPECT_EQ(game->config(), bt::startConfig());
}

/* ===== Игнорируемые действия ===== */

TEST_F(TrackerTest, TapOutsideAwaitingIgnored) {
  game->handleInput(Start);
  game->handleTap(NthBall(true));
  EXPECT_EQ(game->state(), TrackerState::REVEAL);

  Advance(BT_REVEAL_DELAY_MS);
  game->handleTap(game->balls_for_testing()[0].position);
  EXPECT_EQ(game->state(), TrackerState::TRACKING);
  EXPECT_EQ(CountVisual(BALL_CORRECT) + CountVisual(BALL_INCORRECT), 0);
}

TEST_F(TrackerTest, TapOnEmptySpaceIgnored) {
  ToAwaiting();
  game->handleTap(Vec2(BT_ARENA_WIDTH - 5.0, BT_ARENA_HEIGHT - 5.0));
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  EXPECT_EQ(game->foundTargets(), 0u);
}

TEST_F(TrackerTest, LoseTrackOutsideTrackingIgnored) {
  game->handleInput(LoseTrack);
  EXPECT_EQ(game->state(), TrackerState::IDLE);

  game->handleInput(Start);
  game->handleInput(LoseTrack);
  EXPECT_EQ(game->state(), TrackerState::REVEAL);

  Advance(BT_REVEAL_DELAY_MS);
  Advance(BT_TRACKING_DURATION_MS);
  ASSERT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  game->handleInput(LoseTrack);
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  EXPECT_EQ(game->outcome(), OUTCOME_NONE);
  EXPECT_TRUE(game->ledger().history().empty());
}

TEST_F(TrackerTest, StartIgnoredDuringAttempt) {
  ToTracking();
  const unsigned long epoch = game->epoch();
  game->handleInput(Start);
  EXPECT_EQ(game->state(), TrackerState::TRACKING);
  EXPECT_EQ(game->epoch(), epoch);
}

TEST_F(TrackerTest, TerminateDoesNotChangeGame) {
  ToTracking();
  game->handleInput(Terminate);
  EXPECT_EQ(game->state(), TrackerState::TRACKING);
}

/* ===== Таймеры и эпоха ===== */

TEST_F(TrackerTest, StaleTrackingTimerIsDropped) {
  ToTracking();                  // таймер слежения на +6000
  Advance(1000);
  game->handleInput(LoseTrack);  // попытка окончена раньше срока
  game->handleInput(Start);      // новая попытка, REVEAL на +2500
  ASSERT_EQ(game->state(), TrackerState::REVEAL);

  Advance(BT_REVEAL_DELAY_MS);
  ASSERT_EQ(game->state(), TrackerState::TRACKING);

  // срок старого таймера наступает посреди нового слежения
  Advance(BT_TRACKING_DURATION_MS - 1000 - BT_REVEAL_DELAY_MS);
  EXPECT_EQ(game->state(), TrackerState::TRACKING)
      << "timer from the previous attempt must not end this one";
  EXPECT_TRUE(game->motionActive());

  Advance(1000 + BT_REVEAL_DELAY_MS);
  EXPECT_EQ(game->state(), TrackerState::AWAITING_INPUT);
  EXPECT_EQ(game->pending_timers_for_testing(), 0u);
}

TEST_F(TrackerTest, EpochAdvancesPerTransition) {
  EXPECT_EQ(game->epoch(), 0UL);
  game->handleInput(Start);
  EXPECT_EQ(game->epoch(), 2UL) << "IDLE→SETUP→REVEAL";
  Advance(BT_REVEAL_DELAY_MS);
  EXPECT_EQ(game->epoch(), 3UL);
}

/* ===== Инварианты снимка ===== */

TEST_F(TrackerTest, SnapshotValidThroughLongSession) {
  for (int attempt = 0; attempt < 6; ++attempt) {
    game->handleInput(Start);
    for (int frame = 0; frame < 600; ++frame) {
      Advance(16);
      ASSERT_TRUE(bt_is_valid_info(&game->info())) << "frame " << frame;
      if (game->state() == TrackerState::AWAITING_INPUT) break;
    }
    ASSERT_EQ(game->state(), TrackerState::AWAITING_INPUT);
    SpreadBalls();
    const std::uint32_t targets = game->config().target_count;
    for (std::uint32_t i = 0; i < targets; ++i) {
      game->handleTap(NthBall(true, i));
    }
    ASSERT_TRUE(bt_is_valid_info(&game->info()));
  }
  EXPECT_EQ(game->ledger().personalBest(), 6u);
  EXPECT_EQ(game->info().history_count, 6);
}

TEST_F(TrackerTest, HistoryInSnapshot) {
  ToTracking();
  Advance(2000);
  game->handleInput(LoseTrack);

  const TrackerInfo_t& info = game->info();
  ASSERT_EQ(info.history_count, 1);
  EXPECT_EQ(info.history[0].level, 1);
  EXPECT_DOUBLE_EQ(info.history[0].seconds, 2.0);
  EXPECT_FALSE(info.history[0].completed);
}

/* ===== Экспорт ===== */

TEST_F(TrackerTest, ExportEmptyHistory) {
  std::string path;
  EXPECT_EQ(game->exportHistory(&path, fs::temp_directory_path().string()),
            EXPORT_EMPTY);
  EXPECT_TRUE(path.empty());
}

TEST_F(TrackerTest, ExportWritesCsv) {
  ToTracking();
  Advance(2500);
  game->handleInput(LoseTrack);

  fs::path dir = fs::temp_directory_path() /
                 ("balltrack_export_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  std::string path;
  ASSERT_EQ(game->exportHistory(&path, dir.string()), EXPORT_OK);
  EXPECT_EQ(fs::path(path).filename().string(), "tracking_history_1.csv");
  EXPECT_TRUE(fs::exists(path));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

/* ===== C API ===== */

TEST(TrackerApiTest, NullSafe) {
  tracker_destroy(nullptr);
  tracker_update(nullptr);
  tracker_handle_input(nullptr, Start, false);
  tracker_tap(nullptr, 1.0, 1.0);
  EXPECT_EQ(tracker_get_info(nullptr), nullptr);
  char path[64];
  EXPECT_EQ(tracker_export(nullptr, path, sizeof(path)), EXPORT_FAILED);
  EXPECT_FALSE(bt_is_valid_info(nullptr));
}

TEST(TrackerApiTest, CreateLoadsStoredProfile) {
  fs::path dir = fs::temp_directory_path() /
                 ("balltrack_api_" + std::to_string(::getpid()));
  fs::remove_all(dir);

  {
    bt::FileProfileStore store(dir.string());
    ASSERT_TRUE(store.claim(21));
    ASSERT_TRUE(store.saveBest(21, 4));
    ASSERT_TRUE(store.saveHistory(21, {{4, 1.5, true}}));
  }

  void* game = tracker_create(21, dir.string().c_str());
  ASSERT_NE(game, nullptr);

  const TrackerInfo_t* info = tracker_get_info(game);
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->user_id, 21u);
  EXPECT_EQ(info->personal_best, 4);
  EXPECT_EQ(info->history_count, 1);
  EXPECT_EQ(info->level, 1) << "a session always starts from level 1";
  EXPECT_EQ(info->phase, PHASE_IDLE);

  tracker_handle_input(game, Start, false);
  tracker_update(game);
  info = tracker_get_info(game);
  EXPECT_EQ(info->phase, PHASE_REVEAL);
  EXPECT_EQ(info->ball_count, 3);
  EXPECT_TRUE(bt_is_valid_info(info));

  tracker_destroy(game);

  std::error_code ec;
  fs::remove_all(dir, ec);
}
