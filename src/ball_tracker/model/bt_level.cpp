/**
 * @file bt_level.cpp
 * @brief Кривая сложности и генерация уровня
 */

#include "bt_level.hpp"

#include <algorithm>
#include <cmath>

namespace bt {

namespace {

constexpr double kTwoPi = 2.0 * 3.14159265358979323846;

// Равномерно в [radius, dim - radius]; при вырожденной арене - центр.
double spawnCoord_(double dim, double radius, std::mt19937& rng) {
  if (dim - 2.0 * radius <= 0.0) return dim / 2.0;
  std::uniform_real_distribution<double> dist(radius, dim - radius);
  return dist(rng);
}

}  // namespace

/**
 * @brief Параметры следующего уровня
 *
 * Каждый уровень добавляет один шар. Число целей растёт на чётных уровнях
 * до BT_MAX_TARGETS, скорость растёт на BT_SPEED_STEP на каждом третьем.
 *
 * @par Пример:
 * - уровень 1: 3 шара, 1 цель, скорость 2.0
 * - уровень 2: 4 шара, 2 цели, скорость 2.0
 * - уровень 3: 5 шаров, 2 цели, скорость 2.25
 */
LevelConfig nextConfig(std::uint32_t prev_level, std::uint32_t prev_total_balls,
                       std::uint32_t prev_target_count,
                       double prev_speed) noexcept {
  LevelConfig next;
  next.level = prev_level + 1;
  next.total_balls = prev_total_balls + 1;

  next.target_count = prev_target_count;
  if (next.level % 2 == 0 && prev_target_count < BT_MAX_TARGETS) {
    next.target_count++;
  }

  next.speed = prev_speed;
  if (next.level % 3 == 0) {
    next.speed += BT_SPEED_STEP;
  }
  return next;
}

/**
 * @brief Расставляет шары уровня
 *
 * Первые target_count шаров становятся целями и подсвечены, остальные
 * нейтральны. Направление каждого шара случайно, модуль скорости равен
 * config.speed.
 *
 * @note При одинаковом состоянии rng результат повторяется, на этом
 *       построен повтор уровня после ошибки.
 */
std::vector<Ball> generate(const LevelConfig& config, double arena_width,
                           double arena_height, std::mt19937& rng) {
  std::uniform_real_distribution<double> heading(0.0, kTwoPi);
  const std::uint32_t targets = std::min(config.target_count, config.total_balls);

  std::vector<Ball> balls;
  balls.reserve(config.total_balls);

  for (std::uint32_t i = 0; i < config.total_balls; ++i) {
    Ball ball;
    ball.position.x = spawnCoord_(arena_width, ball.radius, rng);
    ball.position.y = spawnCoord_(arena_height, ball.radius, rng);

    const double angle = heading(rng);
    ball.velocity = Vec2(std::cos(angle) * config.speed,
                         std::sin(angle) * config.speed);

    ball.is_target = i < targets;
    ball.visual = ball.is_target ? BALL_HIGHLIGHTED : BALL_NEUTRAL;
    balls.push_back(ball);
  }
  return balls;
}

}  // namespace bt
