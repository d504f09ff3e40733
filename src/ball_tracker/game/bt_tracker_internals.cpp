/**
 * @file bt_tracker_internals.cpp
 * @brief Реализация игровой логики BallTrack на C++17
 *
 * Содержит реализацию класса `bt::TrackerGame`:
 * - последовательность фаз через табличный конечный автомат (fsm_t)
 * - таймеры фаз с проверкой эпохи автомата
 * - движение шаров на каждом кадре фазы слежения
 * - разбор щелчков и подсчёт найденных целей
 * - запись попыток в журнал и переход к следующему уровню
 * - проекцию состояния в TrackerInfo_t для отрисовки
 *
 * @note Публичные статические методы помечены `noexcept`: исключения не
 *       пересекают границу C.
 * @warning Таблица `transitions_` и обработчики входа/выхода меняются
 *          только вместе.
 */

#include "bt_tracker_internals.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>
#include <new>
#include <optional>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "../common/bt_common.h"
#include "../ledger/bt_export.hpp"

namespace bt {

namespace {

constexpr const char* kLabelStart = "Start Level";
constexpr const char* kLabelNext = "Next Level";
constexpr const char* kLabelRetry = "Try Again";

std::string format_(const char* fmt, double value) {
  char buf[BT_TEXT_MAX];
  std::snprintf(buf, sizeof(buf), fmt, value);
  return buf;
}

std::string format_(const char* fmt, unsigned value) {
  char buf[BT_TEXT_MAX];
  std::snprintf(buf, sizeof(buf), fmt, value);
  return buf;
}

}  // namespace

/**
 * @internal
 * @brief Таблица переходов.
 *
 * { текущее_состояние, событие, новое_состояние, on_exit, on_enter }
 *
 * - SETUP → REVEAL выполняется автоматически (FSM_EVENT_NONE) сразу после
 *   входа в SETUP.
 * - Оба выхода из TRACKING проходят через on_state_exit_, который
 *   останавливает движение и секундомер слежения.
 * - События вне таблицы (щелчки вне AWAITING_INPUT, LOSE_TRACK вне
 *   TRACKING, START во время попытки) отклоняются автоматом.
 */
const fsm_transition_t TrackerGame::transitions_[] = {
    {to_fsm_state(TrackerState::IDLE), to_fsm_event(TrackerEvent::START),
     to_fsm_state(TrackerState::SETUP), nullptr, &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::SETUP), to_fsm_event(TrackerEvent::NONE),
     to_fsm_state(TrackerState::REVEAL), nullptr,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::REVEAL),
     to_fsm_event(TrackerEvent::REVEAL_ELAPSED),
     to_fsm_state(TrackerState::TRACKING), nullptr,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::TRACKING),
     to_fsm_event(TrackerEvent::TRACKING_ELAPSED),
     to_fsm_state(TrackerState::AWAITING_INPUT), &TrackerGame::on_state_exit_,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::TRACKING), to_fsm_event(TrackerEvent::LOSE_TRACK),
     to_fsm_state(TrackerState::RESOLVED), &TrackerGame::on_state_exit_,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::AWAITING_INPUT),
     to_fsm_event(TrackerEvent::ALL_FOUND),
     to_fsm_state(TrackerState::RESOLVED), nullptr,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::AWAITING_INPUT),
     to_fsm_event(TrackerEvent::WRONG_PICK),
     to_fsm_state(TrackerState::RESOLVED), nullptr,
     &TrackerGame::on_state_enter_},

    {to_fsm_state(TrackerState::RESOLVED), to_fsm_event(TrackerEvent::START),
     to_fsm_state(TrackerState::SETUP), nullptr, &TrackerGame::on_state_enter_},
};

TrackerGame::TrackerGame(Ledger ledger, Clock clock, std::uint32_t seed)
    : ledger_(std::move(ledger)),
      clock_(std::move(clock)),
      rng_(seed),
      tracking_watch_(clock_),
      reaction_watch_(clock_),
      start_label_(kLabelStart),
      message_("Press Start to begin. Watch the highlighted balls.") {
  bool ok = fsm_init(&fsm_, this, transitions_,
                     sizeof(transitions_) / sizeof(transitions_[0]),
                     to_fsm_state(TrackerState::IDLE));
  if (!ok) {
    throw std::logic_error("tracker transition table is empty");
  }
}

TrackerGame::~TrackerGame() noexcept { fsm_destroy(&fsm_); }

/**
 * @brief Создаёт игру для пользователя с файловым хранилищем.
 *
 * Профиль читается из data_dir (NULL - каталог по умолчанию). Если
 * профиля нет, игра начинается с пустой историей и рекордом 0; файлы
 * появятся при первой записи.
 *
 * @return непрозрачный указатель или nullptr, если не удалось выделить
 *         ресурсы
 */
void* TrackerGame::create(unsigned user_id, const char* data_dir) noexcept {
  try {
    std::string dir;
    if (data_dir != nullptr && data_dir[0] != '\0') {
      dir = data_dir;
    } else {
      char buf[512];
      if (!bt_default_data_dir(buf, sizeof(buf))) {
        spdlog::error("data directory path is too long");
        return nullptr;
      }
      dir = buf;
    }

    auto store = std::make_unique<FileProfileStore>(dir);
    std::optional<UserProfile> loaded = store->load(user_id);
    UserProfile profile;
    profile.user_id = user_id;
    if (loaded) {
      profile = std::move(*loaded);
    }

    std::random_device rd;
    return new TrackerGame(Ledger(std::move(store), std::move(profile)),
                           &steadyClockMs, rd());
  } catch (const std::exception& e) {
    spdlog::error("cannot create game for user {}: {}", user_id, e.what());
    return nullptr;
  }
}

void TrackerGame::destroy(void* game) noexcept {
  if (game != nullptr) {
    delete static_cast<TrackerGame*>(game);
  }
}

void TrackerGame::handle_input(void* game, UserAction_t action,
                               bool hold) noexcept {
  (void)hold;
  if (!game) return;
  static_cast<TrackerGame*>(game)->handleInput(action);
}

void TrackerGame::tap(void* game, double x, double y) noexcept {
  if (!game) return;
  static_cast<TrackerGame*>(game)->handleTap(Vec2(x, y));
}

void TrackerGame::update(void* game) noexcept {
  if (!game) return;
  static_cast<TrackerGame*>(game)->tick();
}

/**
 * @brief Снимок состояния для C API.
 *
 * Указатель ссылается на буферы экземпляра и действителен до следующего
 * изменяющего вызова.
 */
const TrackerInfo_t* TrackerGame::get_info(const void* game) noexcept {
  if (game == nullptr) {
    return nullptr;
  }
  auto* self = const_cast<TrackerGame*>(static_cast<const TrackerGame*>(game));
  try {
    return &self->info();
  } catch (const std::bad_alloc&) {
    spdlog::error("out of memory while building game snapshot");
    return nullptr;
  }
}

ExportResult_t TrackerGame::export_history(const void* game, char* path,
                                           size_t path_len) noexcept {
  if (game == nullptr) return EXPORT_FAILED;
  const auto* self = static_cast<const TrackerGame*>(game);
  try {
    std::string written;
    ExportResult_t result = self->exportHistory(&written);
    if (result == EXPORT_OK && path != nullptr && path_len > 0) {
      std::snprintf(path, path_len, "%s", written.c_str());
    }
    return result;
  } catch (const std::exception& e) {
    spdlog::error("export failed: {}", e.what());
    return EXPORT_FAILED;
  }
}

/**
 * @brief Команда игрока.
 *
 * - Start     → новая попытка из IDLE или RESOLVED; SETUP сразу переходит
 *               в REVEAL
 * - LoseTrack → досрочный выход из TRACKING
 * - Terminate → не меняет игру (выход обрабатывает контроллер)
 */
void TrackerGame::handleInput(UserAction_t action) noexcept {
  switch (action) {
    case Start:
      if (processEvent_(TrackerEvent::START)) {
        fsm_update(&fsm_);
      }
      break;
    case LoseTrack:
      if (state() == TrackerState::TRACKING) {
        outcome_ = OUTCOME_GAVE_UP;
        processEvent_(TrackerEvent::LOSE_TRACK);
      }
      break;
    case Terminate:
    default:
      break;
  }
}

/**
 * @brief Разбор щелчка в AWAITING_INPUT.
 *
 * Перебирает шары в порядке генерации; шары с окончательной отметкой
 * пропускаются. Первый шар, содержащий точку, получает отметку:
 * - цель → BALL_CORRECT; если найдены все цели - ALL_FOUND
 * - не цель → BALL_INCORRECT и WRONG_PICK
 */
void TrackerGame::handleTap(Vec2 point) noexcept {
  if (state() != TrackerState::AWAITING_INPUT) return;

  for (auto& ball : balls_) {
    if (!ball.contains(point) || ball.isResolved()) continue;

    if (ball.is_target) {
      ball.visual = BALL_CORRECT;
      found_targets_++;
      if (found_targets_ == config_.target_count) {
        reaction_watch_.stop();
        outcome_ = OUTCOME_CORRECT;
        processEvent_(TrackerEvent::ALL_FOUND);
      } else {
        message_ = format_("Good job! Find the remaining %u ball(s).",
                           config_.target_count - found_targets_);
      }
    } else {
      ball.visual = BALL_INCORRECT;
      reaction_watch_.stop();
      outcome_ = OUTCOME_INCORRECT;
      processEvent_(TrackerEvent::WRONG_PICK);
    }
    break;
  }
}

void TrackerGame::tick() noexcept {
  fireDueTimers_();

  if (motion_active_) {
    for (auto& ball : balls_) {
      advance(ball, BT_ARENA_WIDTH, BT_ARENA_HEIGHT);
    }
  }
}

const TrackerInfo_t& TrackerGame::info() {
  refreshInfo_();
  return info_;
}

ExportResult_t TrackerGame::exportHistory(std::string* written_path,
                                          const std::string& dir) const {
  const auto& history = ledger_.history();
  if (history.empty()) {
    spdlog::info("nothing to export for user {}", ledger_.userId());
    return EXPORT_EMPTY;
  }

  auto path = writeExport(ledger_.userId(), formatCsv(history), dir);
  if (!path) return EXPORT_FAILED;
  if (written_path != nullptr) *written_path = *path;
  return EXPORT_OK;
}

bool TrackerGame::processEvent_(TrackerEvent ev) noexcept {
  if (ev == TrackerEvent::NONE) return false;
  return fsm_process_event(&fsm_, to_fsm_event(ev));
}

void TrackerGame::schedule_(std::uint64_t delay_ms, TrackerEvent ev) {
  timers_.push_back(PendingTimer{clock_() + delay_ms, fsm_epoch(&fsm_), ev});
}

/**
 * @brief Сработавшие таймеры по порядку срока.
 *
 * Таймер снимается до обработки; если эпоха автомата изменилась с момента
 * планирования, событие не отправляется. Новый таймер, заведённый
 * обработчиком, имеет срок позже текущего момента и ждёт следующего кадра.
 */
void TrackerGame::fireDueTimers_() noexcept {
  const std::uint64_t now = clock_();

  for (;;) {
    auto due = std::min_element(
        timers_.begin(), timers_.end(),
        [](const PendingTimer& a, const PendingTimer& b) {
          return a.due_ms < b.due_ms;
        });
    if (due == timers_.end() || due->due_ms > now) break;

    PendingTimer timer = *due;
    timers_.erase(due);

    if (timer.epoch != fsm_epoch(&fsm_)) {
      spdlog::debug("stale timer for event {} dropped",
                    static_cast<int>(timer.event));
      continue;
    }
    processEvent_(timer.event);
  }
}

void TrackerGame::on_state_enter_(fsm_context_t ctx) {
  auto* self = static_cast<TrackerGame*>(ctx);

  switch (from_fsm_state(self->fsm_.current)) {
    case TrackerState::SETUP:
      self->enterSetup_();
      break;
    case TrackerState::REVEAL:
      self->enterReveal_();
      break;
    case TrackerState::TRACKING:
      self->enterTracking_();
      break;
    case TrackerState::AWAITING_INPUT:
      self->enterAwaitingInput_();
      break;
    case TrackerState::RESOLVED:
      self->enterResolved_();
      break;
    case TrackerState::IDLE:
    default:
      break;
  }
}

void TrackerGame::on_state_exit_(fsm_context_t ctx) {
  auto* self = static_cast<TrackerGame*>(ctx);
  if (from_fsm_state(self->fsm_.current) == TrackerState::TRACKING) {
    self->exitTracking_();
  }
}

void TrackerGame::enterSetup_() {
  balls_ = generate(config_, BT_ARENA_WIDTH, BT_ARENA_HEIGHT, rng_);
  found_targets_ = 0;
  outcome_ = OUTCOME_NONE;
  start_enabled_ = false;
  motion_active_ = false;
  tracking_watch_.stop();
  tracking_watch_.reset();
  reaction_watch_.stop();
  reaction_watch_.reset();
  message_ = format_("Watch the %u highlighted ball(s).", config_.target_count);

  spdlog::debug("level {}: {} balls, {} targets, speed {:.2f}", config_.level,
                config_.total_balls, config_.target_count, config_.speed);
}

void TrackerGame::enterReveal_() { schedule_(BT_REVEAL_DELAY_MS, TrackerEvent::REVEAL_ELAPSED); }

void TrackerGame::enterTracking_() {
  for (auto& ball : balls_) {
    ball.visual = BALL_NEUTRAL;
  }
  tracking_watch_.reset();
  tracking_watch_.start();
  motion_active_ = true;
  message_ = "Tracking... (press SPACE if you lose track)";
  schedule_(BT_TRACKING_DURATION_MS, TrackerEvent::TRACKING_ELAPSED);
}

void TrackerGame::exitTracking_() noexcept {
  motion_active_ = false;
  tracking_watch_.stop();
}

void TrackerGame::enterAwaitingInput_() {
  reaction_watch_.reset();
  reaction_watch_.start();
  message_ = format_("Click the %u ball(s) you were tracking.",
                     config_.target_count - found_targets_);
}

/**
 * @brief Итог попытки.
 *
 * - OUTCOME_CORRECT   - попытка с временем реакции в журнал, следующий
 *                       уровень, обновление рекорда пройденным уровнем
 * - OUTCOME_GAVE_UP   - попытка с временем слежения в журнал, цели
 *                       подсвечиваются, уровень прежний
 * - OUTCOME_INCORRECT - цели подсвечиваются, уровень прежний, в журнал
 *                       ничего не пишется
 */
void TrackerGame::enterResolved_() {
  switch (outcome_) {
    case OUTCOME_CORRECT: {
      const std::uint32_t completed = config_.level;
      ledger_.append(
          AttemptResult{completed, reaction_watch_.elapsedSeconds(), true});
      config_ = nextConfig(config_);
      if (ledger_.updateBestIfHigher(completed)) {
        spdlog::info("user {}: new personal best {}", ledger_.userId(),
                     completed);
      }
      start_label_ = kLabelNext;
      message_ = "Correct! Well done!";
      break;
    }
    case OUTCOME_GAVE_UP: {
      const double seconds = tracking_watch_.elapsedSeconds();
      ledger_.append(AttemptResult{config_.level, seconds, false});
      revealTargets_();
      start_label_ = kLabelRetry;
      message_ = format_("Tracked for %.1fs. Let's see the answer.", seconds);
      break;
    }
    case OUTCOME_INCORRECT:
      revealTargets_();
      start_label_ = kLabelRetry;
      message_ = "Incorrect. Try this level again.";
      break;
    case OUTCOME_NONE:
    default:
      spdlog::warn("attempt resolved without an outcome");
      start_label_ = kLabelRetry;
      break;
  }
  start_enabled_ = true;
}

void TrackerGame::revealTargets_() noexcept {
  for (auto& ball : balls_) {
    if (ball.is_target) {
      ball.visual = BALL_HIGHLIGHTED;
    }
  }
}

void TrackerGame::refreshInfo_() {
  sprites_.clear();
  sprites_.reserve(balls_.size());
  for (const auto& ball : balls_) {
    sprites_.push_back(
        BallSprite_t{ball.position.x, ball.position.y, ball.radius, ball.visual});
  }

  const auto& history = ledger_.history();
  history_view_.clear();
  history_view_.reserve(history.size());
  for (const auto& result : history) {
    history_view_.push_back(AttemptView_t{static_cast<int>(result.level),
                                          result.elapsed_seconds,
                                          result.completed});
  }

  info_.balls = sprites_.empty() ? nullptr : sprites_.data();
  info_.ball_count = static_cast<int>(sprites_.size());
  info_.arena_width = BT_ARENA_WIDTH;
  info_.arena_height = BT_ARENA_HEIGHT;

  info_.phase = static_cast<TrackerPhase_t>(fsm_current(&fsm_));
  info_.outcome = outcome_;

  info_.level = static_cast<int>(config_.level);
  info_.total_balls = static_cast<int>(config_.total_balls);
  info_.target_count = static_cast<int>(config_.target_count);
  info_.speed = config_.speed;
  info_.found_targets = static_cast<int>(found_targets_);

  info_.user_id = ledger_.userId();
  info_.personal_best = static_cast<int>(ledger_.personalBest());

  info_.start_enabled = start_enabled_;
  info_.start_label = start_label_.c_str();
  info_.message = message_.c_str();

  info_.history = history_view_.empty() ? nullptr : history_view_.data();
  info_.history_count = static_cast<int>(history_view_.size());
}

}  // namespace bt
