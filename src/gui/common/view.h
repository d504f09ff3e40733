/**
 * @file view.h
 * @brief Публичный API модуля отображения BallTrack
 *
 * Абстрактный интерфейс (View) для любых видов отображения (CLI, GUI).
 * View ничего не знает об игровой логике: контроллер настраивает зоны,
 * передаёт в них данные и забирает события ввода.
 *
 * Основные идеи:
 * - ViewHandle_t - непрозрачный указатель на контекст интерфейса.
 * - Зоны задаются в ячейках разметки: в CLI ячейка - символ терминала,
 *   в Qt - прямоугольник VIEW_QT_CELL_W × VIEW_QT_CELL_H пикселей.
 * - Элементы: текст, число, набор шаров арены.
 * - Ввод: нажатия клавиш и щелчки по арене (уже в координатах арены).
 *
 * @defgroup View Публичный интерфейс библиотек отображения BallTrack
 * @{
 */

#ifndef VIEW_H
#define VIEW_H

#include <stdbool.h>

#include "../../ball_tracker/bt_tracker.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Непрозрачный контекст View-модуля. */
typedef void *ViewHandle_t;

/** @brief Результат операций View. */
typedef enum {
  VIEW_OK,              ///< Операция успешна
  VIEW_ERROR,           ///< Общая ошибка
  VIEW_INVALID_ID,      ///< Недопустимый element_id
  VIEW_BAD_DATA,        ///< Некорректные данные
  VIEW_NOT_INITIALIZED, ///< View не инициализирован
  VIEW_NO_EVENT         ///< Событие ввода отсутствует (для poll_input)
} ViewResult_t;

/* Логические коды клавиш, общие для всех интерфейсов */
#define VIEW_KEY_ENTER '\n'
#define VIEW_KEY_ESCAPE 27
#define VIEW_KEY_SPACE ' '

/** @brief Вид события ввода. */
typedef enum {
  INPUT_KEY,  ///< нажатие клавиши, код в key_code
  INPUT_TAP   ///< щелчок по арене, координаты арены в x, y
} InputKind_t;

/**
 * @struct InputEvent_t
 * @brief Событие ввода пользователя.
 *
 * Для INPUT_TAP координаты уже пересчитаны из пикселей или символов в
 * единицы арены, заданные последним ELEMENT_BALLS.
 */
typedef struct {
  InputKind_t kind;
  int key_code;
  double x;
  double y;
} InputEvent_t;

/** @brief Тип содержимого зоны. */
typedef enum {
  ELEMENT_TEXT,   ///< const char* (поддерживает '\n')
  ELEMENT_NUMBER, ///< int
  ELEMENT_BALLS   ///< шары арены
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Универсальный контейнер данных зоны.
 *
 * @note Текст копируется при draw_element (до VIEW_TEXT_MAX байт).
 * @note Массив шаров не копируется и должен быть действителен до render().
 */
typedef struct ElementData_t {
  ElementType_t type;
  union {
    const char *text;  ///< для ELEMENT_TEXT
    int number;        ///< для ELEMENT_NUMBER
    struct {           ///< для ELEMENT_BALLS
      const BallSprite_t *data;
      int count;
      double arena_width;
      double arena_height;
    } balls;
  } content;
} ElementData_t;

/** @brief Максимальная длина текста зоны (включая '\0'). */
#define VIEW_TEXT_MAX 1024

/** @brief Размер ячейки разметки в Qt-интерфейсе, пиксели. */
#define VIEW_QT_CELL_W 12
#define VIEW_QT_CELL_H 24

/**
 * @brief Главный интерфейс View (аналог vtable).
 *
 * @code
 * ViewHandle_t view = cli_view.init(80, 30, 60);
 * cli_view.configure_zone(view, "arena", 1, 3, 37, 23);
 * @endcode
 */
typedef struct ViewInterface {
  int version; ///< Версия интерфейса (текущая: 2)

  /**
   * @brief Инициализация движка отображения.
   * @param width  Ширина экрана в ячейках
   * @param height Высота экрана в ячейках
   * @param fps    Частота обновления кадров
   * @return Контекст или NULL при ошибке
   */
  ViewHandle_t (*init)(int width, int height, int fps);

  /**
   * @brief Настраивает зону вывода (повторная настройка перезаписывает).
   */
  ViewResult_t (*configure_zone)(ViewHandle_t handle, const char *element_id,
                                 int x, int y, int max_width, int max_height);

  /**
   * @brief Передаёт данные в зону.
   * @note type должен соответствовать заполненному полю content.
   */
  ViewResult_t (*draw_element)(ViewHandle_t handle, const char *element_id,
                               const ElementData_t *data);

  /** @brief Выводит кадр на экран. */
  ViewResult_t (*render)(ViewHandle_t handle);

  /**
   * @brief Читает одно событие ввода.
   * @return VIEW_OK при наличии события, VIEW_NO_EVENT - если нет
   */
  ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

  /** @brief Завершает работу; handle становится недействительным. */
  ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

/* Текущая версия API */
#define VIEW_INTERFACE_VERSION 2

#ifdef __cplusplus
}
#endif

#endif // VIEW_H

/** @} */
