/**
 * @file bt_ledger.hpp
 * @brief Журнал попыток и рекорд пользователя
 */

#ifndef BT_LEDGER_HPP
#define BT_LEDGER_HPP

#include <memory>

#include "bt_profile_store.hpp"

namespace bt {

/**
 * @brief Журнал попыток одного пользователя.
 *
 * Держит профиль в памяти и сохраняет его после каждого изменения.
 * Запись на диск не блокирует игру: ошибка сохранения попадает в журнал
 * событий, состояние в памяти всё равно обновляется.
 *
 * @note Повторные вызовы не дедуплицируются - вызывающая сторона
 *       обращается к журналу не более одного раза на попытку.
 */
class Ledger {
 public:
  Ledger(std::unique_ptr<ProfileStore> store, UserProfile profile);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;
  Ledger(Ledger&&) noexcept = default;
  Ledger& operator=(Ledger&&) noexcept = default;

  /** @brief Добавить попытку в конец истории и сохранить историю целиком. */
  void append(const AttemptResult& result);

  /**
   * @brief Обновить рекорд, если level больше текущего.
   * @return true, если рекорд изменился
   */
  bool updateBestIfHigher(std::uint32_t level);

  const UserProfile& profile() const noexcept { return profile_; }
  std::uint32_t userId() const noexcept { return profile_.user_id; }
  std::uint32_t personalBest() const noexcept { return profile_.personal_best; }
  const std::vector<AttemptResult>& history() const noexcept {
    return profile_.history;
  }

 private:
  std::unique_ptr<ProfileStore> store_;
  UserProfile profile_;
};

}  // namespace bt

#endif  // BT_LEDGER_HPP
