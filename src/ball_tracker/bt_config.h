/**
 * @file bt_config.h
 * @brief Константы игры BallTrack
 *
 * Все размеры заданы в единицах арены, все длительности - в миллисекундах.
 */

#ifndef BT_CONFIG_H
#define BT_CONFIG_H

/* Размеры арены */
#define BT_ARENA_WIDTH 350.0
#define BT_ARENA_HEIGHT 450.0

/* Радиус шара, одинаковый для всех шаров уровня */
#define BT_BALL_RADIUS 15.0

/* Длительность показа целей перед началом движения */
#define BT_REVEAL_DELAY_MS 2500

/* Длительность фазы слежения */
#define BT_TRACKING_DURATION_MS 6000

/* Параметры первого уровня */
#define BT_START_LEVEL 1
#define BT_START_TOTAL_BALLS 3
#define BT_START_TARGETS 1
#define BT_START_SPEED 2.0

/* Кривая сложности */
#define BT_MAX_TARGETS 5
#define BT_SPEED_STEP 0.25

/* Частота кадров контроллера */
#define BT_FRAME_RATE 60

/* Каталог данных внутри $HOME */
#define BT_DATA_DIR_NAME ".balltrack"
#define BT_LOG_FILE_NAME "balltrack.log"

/* Максимальная длина строк в снимке состояния (включая '\0') */
#define BT_TEXT_MAX 128

#endif /* BT_CONFIG_H */
