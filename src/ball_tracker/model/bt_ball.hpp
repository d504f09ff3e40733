/**
 * @file bt_ball.hpp
 * @brief Шар и его движение внутри арены
 */

#ifndef BT_BALL_HPP
#define BT_BALL_HPP

#include "../bt_config.h"
#include "../bt_tracker.h"

namespace bt {

/** @brief Двумерный вектор в единицах арены. */
struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  constexpr Vec2() noexcept = default;
  constexpr Vec2(double x_, double y_) noexcept : x(x_), y(y_) {}
};

/**
 * @brief Шар уровня.
 *
 * Инвариант: после каждого advance() позиция лежит в
 * [radius, размер - radius] по обеим осям.
 */
struct Ball {
  Vec2 position;
  Vec2 velocity;
  double radius = BT_BALL_RADIUS;
  bool is_target = false;
  BallVisual_t visual = BALL_NEUTRAL;

  /** @brief Шар уже получил окончательную отметку в этой попытке. */
  bool isResolved() const noexcept {
    return visual == BALL_CORRECT || visual == BALL_INCORRECT;
  }

  /** @brief Точка лежит строго внутри окружности шара. */
  bool contains(Vec2 point) const noexcept;
};

/**
 * @brief Сдвинуть шар на один тик.
 *
 * По каждой оси независимо: если край шара пересечёт или уже пересёк
 * стенку, компонента скорости меняет знак (обе оси могут отразиться за
 * один тик). Затем к позиции прибавляется скорость, и результат
 * прижимается к допустимому диапазону.
 */
void advance(Ball& ball, double arena_width, double arena_height) noexcept;

}  // namespace bt

#endif  // BT_BALL_HPP
