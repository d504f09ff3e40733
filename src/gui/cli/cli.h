/**
 * @file cli.h
 * @brief Публичный интерфейс CLI-реализации View для BallTrack (ncurses).
 *
 * Содержит объявление экспортируемого объекта `cli_view`, реализующего
 * универсальный интерфейс отображения @ref ViewInterface. Шары рисуются
 * цветными символами `O`, щелчки мыши по арене приходят как INPUT_TAP.
 *
 * @code
 * ViewHandle_t view = cli_view.init(80, 30, 60);
 * cli_view.configure_zone(view, "arena", 1, 3, 37, 23);
 * // ... отрисовка, ввод, обновление
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Для компиляции требуется библиотека ncurses.
 * @note Реализация сама вызывает initscr() / endwin(); не используйте
 *       ncurses напрямую при работе с этим интерфейсом.
 * @note Пока интерфейс активен, журнал spdlog следует направлять в файл
 *       (spdlog::basic_logger_mt()), иначе сообщения испортят экран.
 *
 * @defgroup Cli_view Реализация CLI-интерфейса
 * @ingroup View
 */

#ifndef CLI_H
#define CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Экземпляр интерфейса отображения для CLI-бэкенда на базе ncurses.
 *
 * Все функции должны вызываться из одного потока - цикла кадров.
 */
extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif // CLI_H

/** @} */
