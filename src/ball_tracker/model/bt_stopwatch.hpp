/**
 * @file bt_stopwatch.hpp
 * @brief Секундомер поверх миллисекундных часов
 */

#ifndef BT_STOPWATCH_HPP
#define BT_STOPWATCH_HPP

#include <cstdint>
#include <functional>
#include <utility>

namespace bt {

/** @brief Источник времени в миллисекундах (монотонный). */
using Clock = std::function<std::uint64_t()>;

/** @brief Монотонные часы процесса на std::chrono::steady_clock. */
std::uint64_t steadyClockMs() noexcept;

/**
 * @brief Секундомер: start / stop / reset, накопленное время в мс.
 *
 * Остановленный секундомер хранит накопленное значение до reset().
 */
class Stopwatch {
 public:
  explicit Stopwatch(Clock clock) : clock_(std::move(clock)) {}

  void start() noexcept;
  void stop() noexcept;
  void reset() noexcept;

  bool isRunning() const noexcept { return running_; }
  std::uint64_t elapsedMs() const noexcept;
  double elapsedSeconds() const noexcept {
    return static_cast<double>(elapsedMs()) / 1000.0;
  }

 private:
  Clock clock_;
  std::uint64_t started_at_ = 0;
  std::uint64_t accumulated_ = 0;
  bool running_ = false;
};

}  // namespace bt

#endif  // BT_STOPWATCH_HPP
