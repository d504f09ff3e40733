/**
 * @file bt_tracker_internals.hpp
 * @brief Внутренняя модель игры BallTrack (C++17)
 *
 * Класс bt::TrackerGame владеет всем состоянием попытки: конечным
 * автоматом фаз, шарами уровня, таймерами фаз, двумя секундомерами и
 * журналом попыток пользователя. Наружу он виден двумя способами:
 * - C API из bt_tracker.h через статические методы create / destroy /
 *   handle_input / tap / update / get_info / export_history
 * - напрямую из C++ (контроллер, тесты), с подменой часов и хранилища
 *
 * Фазы:
 *
 *     IDLE ─START→ SETUP ─(сразу)→ REVEAL ─2.5 с→ TRACKING ─6 с→ AWAITING_INPUT
 *                    ↑                                │                │
 *                    │                          LOSE_TRACK     ALL_FOUND / WRONG_PICK
 *                    │                                ↓                ↓
 *                    └────────────START──────────── RESOLVED ←─────────┘
 *
 * Таймеры фаз запоминают эпоху автомата при планировании; таймер, который
 * сработал после смены фазы, ничего не делает.
 *
 * @note Не потокобезопасен: все вызовы - из одного потока (цикла кадров).
 * @see bt_tracker.cpp - C обёртка
 */

#ifndef BT_TRACKER_INTERNALS_HPP
#define BT_TRACKER_INTERNALS_HPP

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "../../fsm/fsm.h"
#include "../bt_tracker.h"
#include "../ledger/bt_ledger.hpp"
#include "../model/bt_ball.hpp"
#include "../model/bt_level.hpp"
#include "../model/bt_stopwatch.hpp"

namespace bt {

/** @brief Состояния автомата. Порядок совпадает с TrackerPhase_t. */
enum class TrackerState : fsm_state_t {
  IDLE = 0,
  SETUP,
  REVEAL,
  TRACKING,
  AWAITING_INPUT,
  RESOLVED
};

/** @brief События автомата. NONE - автоматический переход. */
enum class TrackerEvent : fsm_event_t {
  NONE = FSM_EVENT_NONE,
  START,
  REVEAL_ELAPSED,
  TRACKING_ELAPSED,
  LOSE_TRACK,
  ALL_FOUND,
  WRONG_PICK
};

constexpr fsm_state_t to_fsm_state(TrackerState s) noexcept {
  return static_cast<fsm_state_t>(s);
}
constexpr TrackerState from_fsm_state(fsm_state_t s) noexcept {
  return static_cast<TrackerState>(s);
}
constexpr fsm_event_t to_fsm_event(TrackerEvent e) noexcept {
  return static_cast<fsm_event_t>(e);
}

class TrackerGame {
 public:
  /**
   * @param ledger журнал пользователя (с хранилищем)
   * @param clock  миллисекундные часы для таймеров и секундомеров
   * @param seed   зерно генератора уровней
   */
  TrackerGame(Ledger ledger, Clock clock, std::uint32_t seed);
  ~TrackerGame() noexcept;

  TrackerGame(const TrackerGame&) = delete;
  TrackerGame& operator=(const TrackerGame&) = delete;

  // --- C API ---------------------------------------------------------------

  static void* create(unsigned user_id, const char* data_dir) noexcept;
  static void destroy(void* game) noexcept;
  static void handle_input(void* game, UserAction_t action, bool hold) noexcept;
  static void tap(void* game, double x, double y) noexcept;
  static void update(void* game) noexcept;
  static const TrackerInfo_t* get_info(const void* game) noexcept;
  static ExportResult_t export_history(const void* game, char* path,
                                       size_t path_len) noexcept;

  // --- C++ API -------------------------------------------------------------

  /** @brief Команда игрока; вне своей фазы игнорируется. */
  void handleInput(UserAction_t action) noexcept;

  /** @brief Щелчок по арене; учитывается только в AWAITING_INPUT. */
  void handleTap(Vec2 point) noexcept;

  /** @brief Кадр: сработавшие таймеры, затем шаг движения шаров. */
  void tick() noexcept;

  /** @brief Снимок состояния для отрисовки (пересобирается при вызове). */
  const TrackerInfo_t& info();

  /**
   * @brief Экспорт истории в CSV в каталог dir (пусто - временный каталог).
   * @param[out] written_path путь записанного файла при EXPORT_OK
   */
  ExportResult_t exportHistory(std::string* written_path,
                               const std::string& dir = {}) const;

  TrackerState state() const noexcept { return from_fsm_state(fsm_current(&fsm_)); }
  TrackerOutcome_t outcome() const noexcept { return outcome_; }
  const LevelConfig& config() const noexcept { return config_; }
  const Ledger& ledger() const noexcept { return ledger_; }
  std::uint32_t foundTargets() const noexcept { return found_targets_; }
  bool startEnabled() const noexcept { return start_enabled_; }
  bool motionActive() const noexcept { return motion_active_; }
  unsigned long epoch() const noexcept { return fsm_epoch(&fsm_); }

#ifdef BT_TEST_ACCESS
  std::vector<Ball>& balls_for_testing() noexcept { return balls_; }
  std::size_t pending_timers_for_testing() const noexcept {
    return timers_.size();
  }
#endif

 private:
  struct PendingTimer {
    std::uint64_t due_ms;
    unsigned long epoch;
    TrackerEvent event;
  };

  static const fsm_transition_t transitions_[];

  static void on_state_enter_(fsm_context_t ctx);
  static void on_state_exit_(fsm_context_t ctx);

  bool processEvent_(TrackerEvent ev) noexcept;
  void schedule_(std::uint64_t delay_ms, TrackerEvent ev);
  void fireDueTimers_() noexcept;

  void enterSetup_();
  void enterReveal_();
  void enterTracking_();
  void enterAwaitingInput_();
  void enterResolved_();
  void exitTracking_() noexcept;

  void revealTargets_() noexcept;
  void refreshInfo_();

  fsm_t fsm_{};
  Ledger ledger_;
  Clock clock_;
  std::mt19937 rng_;

  LevelConfig config_ = startConfig();
  std::vector<Ball> balls_;
  std::vector<PendingTimer> timers_;
  Stopwatch tracking_watch_;
  Stopwatch reaction_watch_;

  std::uint32_t found_targets_ = 0;
  TrackerOutcome_t outcome_ = OUTCOME_NONE;
  bool motion_active_ = false;
  bool start_enabled_ = true;
  std::string start_label_;
  std::string message_;

  // Буферы снимка для C API
  TrackerInfo_t info_{};
  std::vector<BallSprite_t> sprites_;
  std::vector<AttemptView_t> history_view_;
};

}  // namespace bt

#endif  // BT_TRACKER_INTERNALS_HPP
