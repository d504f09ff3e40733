/**
 * @file bt_ledger.cpp
 * @brief Журнал попыток и личный рекорд игрока
 */

#include "bt_ledger.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace bt {

/**
 * @brief Создаёт журнал поверх загруженного профиля
 *
 * @param store хранилище для записи изменений; nullptr - журнал живёт
 *        только в памяти (так его используют тесты)
 * @param profile профиль, прочитанный из хранилища
 */
Ledger::Ledger(std::unique_ptr<ProfileStore> store, UserProfile profile)
    : store_(std::move(store)), profile_(std::move(profile)) {}

/**
 * @brief Добавляет результат попытки в конец истории
 *
 * История только растёт: записи не переупорядочиваются и не удаляются.
 * После каждого добавления история целиком перезаписывается в хранилище.
 *
 * @warning Ошибка записи не откатывает добавление. Запись остаётся в памяти
 *          и попадёт в файл при следующем успешном сохранении.
 */
void Ledger::append(const AttemptResult& result) {
  profile_.history.push_back(result);
  if (store_ && !store_->saveHistory(profile_.user_id, profile_.history)) {
    spdlog::error("history of user {} was not saved ({} attempts)",
                  profile_.user_id, profile_.history.size());
  }
}

/**
 * @brief Обновляет личный рекорд, если level больше текущего
 *
 * @return true, если рекорд изменился
 *
 * @code
 * ledger.updateBestIfHigher(3);  // рекорд 2 -> 3, true
 * ledger.updateBestIfHigher(3);  // без изменений, false
 * @endcode
 */
bool Ledger::updateBestIfHigher(std::uint32_t level) {
  if (level <= profile_.personal_best) return false;

  profile_.personal_best = level;
  if (store_ && !store_->saveBest(profile_.user_id, level)) {
    spdlog::error("best level {} of user {} was not saved", level,
                  profile_.user_id);
  }
  return true;
}

}  // namespace bt
