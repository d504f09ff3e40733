/**
 * @file bt_controller.hpp
 * @brief Контроллер BallTrack: цикл кадров между игрой и интерфейсом
 *
 * Контроллер связывает C API игры (bt_tracker.h) с любой реализацией
 * ViewInterface (CLI или Qt). За кадр он:
 * 1. забирает все события ввода и превращает их в команды игры
 * 2. вызывает tracker_update()
 * 3. раскладывает снимок TrackerInfo_t по зонам экрана
 * 4. выводит кадр и спит до начала следующего
 *
 * @note Контроллер не владеет игрой; интерфейсом владеет между open() и
 *       деструктором.
 */

#ifndef BT_CONTROLLER_HPP
#define BT_CONTROLLER_HPP

#include <cstddef>
#include <string>

#include "../ball_tracker/bt_config.h"
#include "../ball_tracker/bt_tracker.h"
#include "../gui/common/view.h"

namespace bt {

/** @brief Команда, в которую превращается нажатие клавиши. */
enum class Command { NONE, START, LOSE_TRACK, EXPORT, QUIT };

/**
 * @brief Раскладка клавиш.
 *
 * - Enter, s, S → START
 * - пробел      → LOSE_TRACK
 * - e, E        → EXPORT
 * - q, Q, Esc   → QUIT
 */
Command commandForKey(int key_code) noexcept;

/**
 * @brief Разбор идентификатора игрока.
 *
 * Допускаются только десятичные цифры (без знака и пробелов внутри),
 * значение должно помещаться в unsigned. Пробелы по краям отбрасываются.
 *
 * @return true и значение в *out, если строка корректна
 */
bool parseUserId(const std::string& text, unsigned* out) noexcept;

/** @brief Строка истории: `Level N: Answered in X.Xs` / `Level N: Gave up at X.Xs`. */
std::string formatAttempt(const AttemptView_t& attempt);

/** @brief Блок истории, новые попытки сверху, не длиннее max_lines строк. */
std::string formatHistory(const TrackerInfo_t& info, std::size_t max_lines);

class Controller {
 public:
  Controller(const ViewInterface& view, void* game, int fps = BT_FRAME_RATE);
  ~Controller() noexcept;

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /** @brief Инициализировать интерфейс и разметить зоны. */
  bool open(int width = kScreenWidth, int height = kScreenHeight);

  /** @brief Цикл кадров до команды выхода. @return код выхода процесса */
  int run();

  /** @brief Один кадр без ожидания. @return false, если получен выход */
  bool step();

  const std::string& notice() const noexcept { return notice_; }

  static constexpr int kScreenWidth = 80;
  static constexpr int kScreenHeight = 29;

 private:
  void dispatch_(const InputEvent_t& event);
  void exportHistory_();
  void draw_(const TrackerInfo_t& info);
  void drawText_(const char* zone, const std::string& text);

  const ViewInterface& view_;
  ViewHandle_t handle_ = nullptr;
  void* game_;
  int fps_;
  bool quit_ = false;
  std::string notice_;
};

}  // namespace bt

#endif  // BT_CONTROLLER_HPP
