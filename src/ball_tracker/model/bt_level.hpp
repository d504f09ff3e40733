/**
 * @file bt_level.hpp
 * @brief Параметры уровня, кривая сложности и генерация шаров
 */

#ifndef BT_LEVEL_HPP
#define BT_LEVEL_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "bt_ball.hpp"

namespace bt {

/**
 * @brief Параметры одной попытки уровня.
 *
 * Вычисляются только через startConfig() / nextConfig() и не меняются,
 * пока попытка идёт.
 */
struct LevelConfig {
  std::uint32_t level = BT_START_LEVEL;
  std::uint32_t total_balls = BT_START_TOTAL_BALLS;
  std::uint32_t target_count = BT_START_TARGETS;
  double speed = BT_START_SPEED;

  bool operator==(const LevelConfig& other) const noexcept {
    return level == other.level && total_balls == other.total_balls &&
           target_count == other.target_count && speed == other.speed;
  }
  bool operator!=(const LevelConfig& other) const noexcept {
    return !(*this == other);
  }
};

/** @brief Конфигурация первого уровня: 3 шара, 1 цель, скорость 2.0. */
constexpr LevelConfig startConfig() noexcept { return LevelConfig{}; }

/**
 * @brief Конфигурация следующего уровня.
 *
 * - уровень + 1
 * - целей + 1, если новый уровень чётный и целей меньше BT_MAX_TARGETS
 * - шаров + 1 всегда
 * - скорость + BT_SPEED_STEP, если новый уровень кратен 3
 */
LevelConfig nextConfig(std::uint32_t prev_level, std::uint32_t prev_total_balls,
                       std::uint32_t prev_target_count,
                       double prev_speed) noexcept;

inline LevelConfig nextConfig(const LevelConfig& prev) noexcept {
  return nextConfig(prev.level, prev.total_balls, prev.target_count,
                    prev.speed);
}

/**
 * @brief Сгенерировать шары уровня.
 *
 * Ровно config.total_balls шаров; позиции равномерно в
 * [radius, размер - radius], направление равномерно в [0, 2π), модуль
 * скорости config.speed. Первые config.target_count шаров - цели в
 * состоянии BALL_HIGHLIGHTED, остальные BALL_NEUTRAL. Пересечения шаров
 * при появлении допускаются.
 */
std::vector<Ball> generate(const LevelConfig& config, double arena_width,
                           double arena_height, std::mt19937& rng);

}  // namespace bt

#endif  // BT_LEVEL_HPP
