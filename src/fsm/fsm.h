/**
 * @file fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Табличный конечный автомат с колбэками и счётчиком переходов
 *
 * Библиотека не знает ничего об игровой логике: пользовательский код
 * описывает состояния и события целыми числами, а переходы - таблицей.
 *
 * Кроме текущего состояния автомат хранит эпоху - число выполненных
 * переходов. Отложенные действия (таймеры) запоминают эпоху при
 * планировании и сравнивают её при срабатывании: если эпоха изменилась,
 * фаза, для которой таймер был заведён, уже закончилась.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_START = 1, EVT_TIMEOUT };
 * enum { STATE_IDLE = 0, STATE_RUN, STATE_DONE };
 *
 * static const fsm_transition_t table[] = {
 *   {STATE_IDLE, EVT_START, STATE_RUN, NULL, on_enter_run},
 *   {STATE_RUN, EVT_TIMEOUT, STATE_DONE, on_exit_run, NULL},
 *   {STATE_DONE, FSM_EVENT_NONE, STATE_IDLE, NULL, NULL}  // автопереход
 * };
 *
 * fsm_t fsm;
 * fsm_init(&fsm, &ctx, table, 3, STATE_IDLE);
 * fsm_process_event(&fsm, EVT_START);
 * unsigned long timer_epoch = fsm_epoch(&fsm);
 * // ... позже, при срабатывании таймера
 * if (fsm_epoch(&fsm) == timer_epoch) fsm_process_event(&fsm, EVT_TIMEOUT);
 * @endcode
 *
 * @date October 2026
 *
 * @{
 */

#ifndef FSM_H
#define FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Событие автоматического перехода.
 *
 * Строка таблицы с этим событием выполняется только через fsm_update().
 * @warning Не используйте 0 для пользовательских событий.
 */
#define FSM_EVENT_NONE 0

/** @brief Идентификатор события. Значение 0 зарезервировано. */
typedef int fsm_event_t;

/** @brief Идентификатор состояния. */
typedef int fsm_state_t;

/** @brief Непрозрачный пользовательский контекст, передаётся в колбэки. */
typedef void *fsm_context_t;

/**
 * @brief Колбэк входа или выхода из состояния.
 *
 * @note Повторный вызов fsm_process_event() / fsm_update() изнутри колбэка
 *       отклоняется флагом `processing`.
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило "из `src` по `event` в `dst`".
 *
 * @note При совпадении нескольких правил выполняется первое в таблице.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;   ///< вызывается, пока current == src (может быть NULL)
  fsm_cb_t on_enter;  ///< вызывается, когда current == dst (может быть NULL)
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Состояние автомата.
 *
 * @note Не изменяйте поля вручную - используйте API.
 */
typedef struct {
  const fsm_transition_t *transitions;  ///< таблица (автомат ею не владеет)
  size_t count;
  fsm_state_t current;
  fsm_context_t ctx;
  unsigned long epoch;  ///< число выполненных переходов
  bool processing;
} fsm_t;

/**
 * @brief Инициализировать автомат.
 *
 * @return true при успехе; false, если fsm или transitions равны NULL или
 *         count == 0.
 *
 * @post fsm->current == start_state, fsm->epoch == 0
 * @note on_enter для start_state не вызывается.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Отвязать автомат от таблицы и контекста.
 *
 * Безопасна при NULL. Память под fsm_t не освобождает.
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Обработать событие.
 *
 * Ищет первое правило с `src == current` и `event == event`, выполняет
 * on_exit → смена состояния → epoch + 1 → on_enter.
 *
 * @return true, если переход выполнен; false, если правила нет, событие
 *         равно FSM_EVENT_NONE, идёт обработка другого события или
 *         fsm == NULL.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Выполнить автоматический переход (правило с FSM_EVENT_NONE).
 *
 * @return true, если переход выполнен.
 */
bool fsm_update(fsm_t *fsm);

/** @brief Текущее состояние; -1 при fsm == NULL. */
fsm_state_t fsm_current(const fsm_t *fsm);

/** @brief Текущая эпоха; 0 при fsm == NULL. */
unsigned long fsm_epoch(const fsm_t *fsm);

#ifdef __cplusplus
}
#endif

#endif /* FSM_H */

/** @} */  // end of FSM module
