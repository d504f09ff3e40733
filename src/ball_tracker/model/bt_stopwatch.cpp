/**
 * @file bt_stopwatch.cpp
 * @brief Секундомер на подменяемых часах
 */

#include "bt_stopwatch.hpp"

#include <chrono>

namespace bt {

/** @brief Монотонное время в миллисекундах (steady_clock). */
std::uint64_t steadyClockMs() noexcept {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
          .count());
}

/**
 * @brief Запускает отсчёт
 * @note Повторный запуск работающего секундомера ничего не делает.
 */
void Stopwatch::start() noexcept {
  if (running_) return;
  started_at_ = clock_();
  running_ = true;
}

// Накопленное время сохраняется до reset()
void Stopwatch::stop() noexcept {
  if (!running_) return;
  accumulated_ += clock_() - started_at_;
  running_ = false;
}

/**
 * @brief Обнуляет накопленное время
 *
 * Работающий секундомер не останавливается: отсчёт начинается заново
 * с текущего момента.
 */
void Stopwatch::reset() noexcept {
  accumulated_ = 0;
  started_at_ = running_ ? clock_() : 0;
}

std::uint64_t Stopwatch::elapsedMs() const noexcept {
  if (!running_) return accumulated_;
  return accumulated_ + (clock_() - started_at_);
}

}  // namespace bt
