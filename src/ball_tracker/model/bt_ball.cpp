/**
 * @file bt_ball.cpp
 * @brief Отражение шара от стенок арены
 */

#include "bt_ball.hpp"

#include <algorithm>
#include <cmath>

namespace bt {

namespace {

// Одна ось: отражение и шаг. dim < 2r возможно только при вырожденной
// арене, тогда шар держится по центру.
void stepAxis_(double& pos, double& vel, double radius, double dim) noexcept {
  const double next = pos + vel;
  if (next + radius >= dim || next - radius <= 0.0) {
    vel = -vel;
  }

  const double lo = radius;
  const double hi = dim - radius;
  if (hi < lo) {
    pos = dim / 2.0;
    return;
  }
  pos = std::clamp(pos + vel, lo, hi);
}

}  // namespace

// Граница круга не считается попаданием
bool Ball::contains(Vec2 point) const noexcept {
  const double dx = point.x - position.x;
  const double dy = point.y - position.y;
  return std::hypot(dx, dy) < radius;
}

/**
 * @brief Один шаг движения шара
 *
 * Оси обрабатываются независимо, поэтому в углу арены за один шаг могут
 * смениться обе составляющие скорости.
 *
 * @warning Функция меняет и позицию, и скорость шара.
 */
void advance(Ball& ball, double arena_width, double arena_height) noexcept {
  stepAxis_(ball.position.x, ball.velocity.x, ball.radius, arena_width);
  stepAxis_(ball.position.y, ball.velocity.y, ball.radius, arena_height);
}

}  // namespace bt
