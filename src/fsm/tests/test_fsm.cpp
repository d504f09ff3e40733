#include <gtest/gtest.h>

#include <string>

extern "C" {
#include "fsm.h"
}

namespace {

enum { EVT_START = 1, EVT_STOP, EVT_BOUNCE };
enum { ST_IDLE = 0, ST_RUN, ST_DONE };

// Журнал вызовов колбэков для проверки порядка
struct Probe {
  fsm_t* fsm = nullptr;
  std::string trace;
  fsm_state_t seen_on_exit = -1;
  fsm_state_t seen_on_enter = -1;
  unsigned long epoch_on_enter = 0;
  bool reentry_result = true;
};

void OnExit(fsm_context_t ctx) {
  auto* p = static_cast<Probe*>(ctx);
  p->trace += "x";
  p->seen_on_exit = fsm_current(p->fsm);
}

void OnEnter(fsm_context_t ctx) {
  auto* p = static_cast<Probe*>(ctx);
  p->trace += "e";
  p->seen_on_enter = fsm_current(p->fsm);
  p->epoch_on_enter = fsm_epoch(p->fsm);
}

// Пытается отправить событие изнутри колбэка
void OnEnterReentrant(fsm_context_t ctx) {
  auto* p = static_cast<Probe*>(ctx);
  p->reentry_result = fsm_process_event(p->fsm, EVT_STOP);
}

const fsm_transition_t kTable[] = {
    {ST_IDLE, EVT_START, ST_RUN, OnExit, OnEnter},
    {ST_RUN, EVT_STOP, ST_DONE, OnExit, OnEnter},
    {ST_DONE, FSM_EVENT_NONE, ST_IDLE, nullptr, nullptr},
    // первое совпадение выигрывает: эта строка недостижима
    {ST_IDLE, EVT_START, ST_DONE, nullptr, nullptr},
};

class FsmTest : public ::testing::Test {
 protected:
  fsm_t fsm{};
  Probe probe;

  void SetUp() override {
    probe.fsm = &fsm;
    ASSERT_TRUE(fsm_init(&fsm, &probe, kTable,
                         sizeof(kTable) / sizeof(kTable[0]), ST_IDLE));
  }

  void TearDown() override { fsm_destroy(&fsm); }
};

}  // namespace

/* ===== Инициализация ===== */

TEST(FsmInitTest, RejectsBadArguments) {
  fsm_t fsm{};
  EXPECT_FALSE(fsm_init(nullptr, nullptr, kTable, 1, ST_IDLE));
  EXPECT_FALSE(fsm_init(&fsm, nullptr, nullptr, 1, ST_IDLE));
  EXPECT_FALSE(fsm_init(&fsm, nullptr, kTable, 0, ST_IDLE));
}

TEST(FsmInitTest, NullSafeQueries) {
  EXPECT_EQ(fsm_current(nullptr), -1);
  EXPECT_EQ(fsm_epoch(nullptr), 0UL);
  EXPECT_FALSE(fsm_process_event(nullptr, EVT_START));
  EXPECT_FALSE(fsm_update(nullptr));
  fsm_destroy(nullptr);
}

TEST_F(FsmTest, StartsInGivenStateWithZeroEpoch) {
  EXPECT_EQ(fsm_current(&fsm), ST_IDLE);
  EXPECT_EQ(fsm_epoch(&fsm), 0UL);
  EXPECT_TRUE(probe.trace.empty()) << "on_enter must not run for the start state";
}

/* ===== Переходы ===== */

TEST_F(FsmTest, TransitionRunsExitThenEnter) {
  ASSERT_TRUE(fsm_process_event(&fsm, EVT_START));
  EXPECT_EQ(fsm_current(&fsm), ST_RUN);
  EXPECT_EQ(probe.trace, "xe");
  EXPECT_EQ(probe.seen_on_exit, ST_IDLE) << "on_exit sees the source state";
  EXPECT_EQ(probe.seen_on_enter, ST_RUN) << "on_enter sees the target state";
  EXPECT_EQ(probe.epoch_on_enter, 1UL) << "epoch advances before on_enter";
}

TEST_F(FsmTest, FirstMatchingRowWins) {
  ASSERT_TRUE(fsm_process_event(&fsm, EVT_START));
  EXPECT_EQ(fsm_current(&fsm), ST_RUN);
}

TEST_F(FsmTest, UnknownEventIsRejected) {
  EXPECT_FALSE(fsm_process_event(&fsm, EVT_STOP));
  EXPECT_FALSE(fsm_process_event(&fsm, EVT_BOUNCE));
  EXPECT_EQ(fsm_current(&fsm), ST_IDLE);
  EXPECT_EQ(fsm_epoch(&fsm), 0UL);
  EXPECT_TRUE(probe.trace.empty());
}

TEST_F(FsmTest, NoneEventOnlyThroughUpdate) {
  ASSERT_TRUE(fsm_process_event(&fsm, EVT_START));
  ASSERT_TRUE(fsm_process_event(&fsm, EVT_STOP));
  EXPECT_EQ(fsm_current(&fsm), ST_DONE);

  EXPECT_FALSE(fsm_process_event(&fsm, FSM_EVENT_NONE));
  EXPECT_EQ(fsm_current(&fsm), ST_DONE);

  EXPECT_TRUE(fsm_update(&fsm));
  EXPECT_EQ(fsm_current(&fsm), ST_IDLE);
  EXPECT_EQ(fsm_epoch(&fsm), 3UL);

  EXPECT_FALSE(fsm_update(&fsm)) << "IDLE has no automatic transition";
}

TEST_F(FsmTest, EpochCountsEveryTransition) {
  for (int round = 0; round < 4; ++round) {
    ASSERT_TRUE(fsm_process_event(&fsm, EVT_START));
    ASSERT_TRUE(fsm_process_event(&fsm, EVT_STOP));
    ASSERT_TRUE(fsm_update(&fsm));
  }
  EXPECT_EQ(fsm_epoch(&fsm), 12UL);
}

/* ===== Повторный вход ===== */

TEST(FsmReentryTest, EventFromCallbackIsRejected) {
  const fsm_transition_t table[] = {
      {ST_IDLE, EVT_START, ST_RUN, nullptr, OnEnterReentrant},
      {ST_RUN, EVT_STOP, ST_DONE, nullptr, nullptr},
  };
  fsm_t fsm{};
  Probe probe;
  probe.fsm = &fsm;
  ASSERT_TRUE(fsm_init(&fsm, &probe, table, 2, ST_IDLE));

  ASSERT_TRUE(fsm_process_event(&fsm, EVT_START));
  EXPECT_FALSE(probe.reentry_result);
  EXPECT_EQ(fsm_current(&fsm), ST_RUN);

  // после выхода из колбэка события снова принимаются
  EXPECT_TRUE(fsm_process_event(&fsm, EVT_STOP));
  EXPECT_EQ(fsm_current(&fsm), ST_DONE);
}
