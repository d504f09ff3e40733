/**
 * @file bt_tracker.h
 * @brief Публичный C интерфейс игры BallTrack
 *
 * Игра скрыта за непрозрачным указателем `void*`. Контроллер создаёт
 * экземпляр через tracker_create(), передаёт ему ввод, вызывает
 * tracker_update() на каждом кадре и рисует снимок tracker_get_info().
 *
 * @code
 * void *game = tracker_create(42, "/home/user/.balltrack");
 * tracker_handle_input(game, Start, false);
 * while (running) {
 *   tracker_update(game);
 *   const TrackerInfo_t *info = tracker_get_info(game);
 *   draw(info);
 * }
 * tracker_destroy(game);
 * @endcode
 *
 * @see bt_tracker_internals.hpp - реализация на C++
 */

#ifndef BT_TRACKER_H
#define BT_TRACKER_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum UserAction_t
 * @brief Команды игрока.
 *
 * Щелчки по арене передаются отдельно через tracker_tap().
 */
typedef enum UserAction_t {
  Start,      ///< старт / следующий уровень / повтор
  LoseTrack,  ///< "потерял шары" во время слежения
  Terminate   ///< выход (обрабатывается контроллером)
} UserAction_t;

/** @brief Визуальное состояние шара. */
typedef enum {
  BALL_NEUTRAL,
  BALL_HIGHLIGHTED,
  BALL_CORRECT,
  BALL_INCORRECT
} BallVisual_t;

/** @brief Фаза игры. */
typedef enum {
  PHASE_IDLE,
  PHASE_SETUP,
  PHASE_REVEAL,
  PHASE_TRACKING,
  PHASE_AWAITING_INPUT,
  PHASE_RESOLVED
} TrackerPhase_t;

/** @brief Исход попытки (значим только в PHASE_RESOLVED). */
typedef enum {
  OUTCOME_NONE,
  OUTCOME_CORRECT,
  OUTCOME_INCORRECT,
  OUTCOME_GAVE_UP
} TrackerOutcome_t;

/** @brief Шар в том виде, в котором его видит отрисовка. */
typedef struct {
  double x;
  double y;
  double radius;
  BallVisual_t visual;
} BallSprite_t;

/** @brief Запись истории попыток. */
typedef struct {
  int level;
  double seconds;
  bool completed;
} AttemptView_t;

/**
 * @struct TrackerInfo_t
 * @brief Снимок состояния для отрисовки.
 *
 * @note Указатели balls и history принадлежат игре и действительны до
 *       следующего вызова tracker_update(), tracker_handle_input(),
 *       tracker_tap() или tracker_destroy().
 */
typedef struct TrackerInfo_t {
  const BallSprite_t *balls;
  int ball_count;
  double arena_width;
  double arena_height;

  TrackerPhase_t phase;
  TrackerOutcome_t outcome;

  int level;
  int total_balls;
  int target_count;
  double speed;
  int found_targets;

  unsigned user_id;
  int personal_best;

  bool start_enabled;
  const char *start_label;
  const char *message;

  const AttemptView_t *history;
  int history_count;
} TrackerInfo_t;

/** @brief Результат экспорта истории. */
typedef enum {
  EXPORT_OK,
  EXPORT_EMPTY,   ///< история пуста, экспортировать нечего
  EXPORT_FAILED   ///< файл не удалось записать
} ExportResult_t;

/**
 * @brief Создать игру для пользователя.
 *
 * Профиль загружается из каталога data_dir; если профиля нет, игра
 * начинается с пустой историей.
 *
 * @return непрозрачный указатель или NULL при ошибке
 */
void *tracker_create(unsigned user_id, const char *data_dir);

/** @brief Уничтожить игру. Безопасна при NULL. */
void tracker_destroy(void *game);

/** @brief Передать команду игрока. Команды вне своей фазы игнорируются. */
void tracker_handle_input(void *game, UserAction_t action, bool hold);

/** @brief Щелчок по арене в координатах арены. */
void tracker_tap(void *game, double x, double y);

/** @brief Один кадр: таймеры фаз и движение шаров. */
void tracker_update(void *game);

/** @brief Снимок состояния; NULL при game == NULL. */
const TrackerInfo_t *tracker_get_info(const void *game);

/**
 * @brief Экспортировать историю в CSV.
 *
 * @param[out] path    путь созданного файла (может быть NULL)
 * @param      path_len размер буфера path
 */
ExportResult_t tracker_export(const void *game, char *path, size_t path_len);

#ifdef __cplusplus
}
#endif

#endif /* BT_TRACKER_H */
