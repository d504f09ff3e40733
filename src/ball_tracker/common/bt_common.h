/**
 * @file bt_common.h
 * @brief Общие утилиты BallTrack
 *
 * Функции, которые используются и игровой моделью, и интерфейсами:
 * - каталог данных игры (~/.balltrack)
 * - валидация команд и снимков состояния
 *
 * Файл компилируется как C и доступен из C++ через extern "C".
 */

#ifndef BT_COMMON_H
#define BT_COMMON_H

#include <stdbool.h>
#include <stddef.h>

#include "../bt_tracker.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Путь каталога данных по умолчанию: `$HOME/.balltrack`.
 *
 * Если HOME не задан, используется текущий каталог.
 *
 * @return true, если путь поместился в буфер
 */
bool bt_default_data_dir(char *buf, size_t len);

/**
 * @brief Создать каталог (0755), если его нет.
 *
 * @return true, если каталог существует после вызова; при false причина
 *         остаётся в errno
 */
bool bt_ensure_dir(const char *path);

/** @brief Проверить, что action - допустимое значение UserAction_t. */
bool bt_is_valid_action(UserAction_t action);

/**
 * @brief Проверить снимок состояния.
 *
 * Проверяет:
 * - указатели balls/history не NULL при ненулевых счётчиках
 * - ball_count == total_balls, пока попытка идёт (SETUP … AWAITING_INPUT);
 *   после успешной попытки total_balls уже относится к следующему уровню
 * - каждый шар лежит в [radius, размер - radius] по обеим осям
 * - 0 <= found_targets <= target_count <= total_balls
 * - message и start_label не NULL
 */
bool bt_is_valid_info(const TrackerInfo_t *info);

#ifdef __cplusplus
}
#endif

#endif /* BT_COMMON_H */
