/**
 * @file bt_profile_store.hpp
 * @brief Профиль пользователя и его хранилище
 *
 * Хранилище отвечает только за чтение и запись записей профиля по
 * идентификатору. Правила обновления (монотонный рекорд, порядок истории)
 * реализует bt::Ledger.
 */

#ifndef BT_PROFILE_STORE_HPP
#define BT_PROFILE_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bt {

/** @brief Итог одной попытки уровня. */
struct AttemptResult {
  std::uint32_t level = 0;
  double elapsed_seconds = 0.0;
  bool completed = false;  ///< false - игрок сдался во время слежения

  bool operator==(const AttemptResult& other) const noexcept {
    return level == other.level && elapsed_seconds == other.elapsed_seconds &&
           completed == other.completed;
  }
};

/** @brief Профиль пользователя целиком. */
struct UserProfile {
  std::uint32_t user_id = 0;
  std::uint32_t personal_best = 0;
  std::vector<AttemptResult> history;
};

/**
 * @brief Хранилище профилей.
 *
 * Идентификатор, однажды занятый через claim(), занят навсегда.
 * Методы записи возвращают false при ошибке ввода-вывода.
 */
class ProfileStore {
 public:
  virtual ~ProfileStore() = default;

  virtual bool exists(std::uint32_t user_id) const noexcept = 0;

  /** @brief Занять идентификатор; false, если он уже занят или не записан. */
  virtual bool claim(std::uint32_t user_id) noexcept = 0;

  /** @brief Загрузить профиль; std::nullopt, если профиля нет. */
  virtual std::optional<UserProfile> load(std::uint32_t user_id) const = 0;

  virtual bool saveBest(std::uint32_t user_id, std::uint32_t level) noexcept = 0;
  virtual bool saveHistory(std::uint32_t user_id,
                           const std::vector<AttemptResult>& history) noexcept = 0;
};

/**
 * @brief Хранилище в каталоге на диске.
 *
 * Для каждого пользователя два файла:
 * - `<dir>/<id>.best`    - одно целое число, рекорд
 * - `<dir>/<id>.history` - по строке на попытку: `level seconds completed`
 *
 * Файлы перезаписываются целиком. Повреждённая история читается как
 * пустая (с предупреждением в журнале), повреждённый рекорд - как 0.
 */
class FileProfileStore final : public ProfileStore {
 public:
  explicit FileProfileStore(std::string dir);

  bool exists(std::uint32_t user_id) const noexcept override;
  bool claim(std::uint32_t user_id) noexcept override;
  std::optional<UserProfile> load(std::uint32_t user_id) const override;
  bool saveBest(std::uint32_t user_id, std::uint32_t level) noexcept override;
  bool saveHistory(std::uint32_t user_id,
                   const std::vector<AttemptResult>& history) noexcept override;

  const std::string& dir() const noexcept { return dir_; }

 private:
  std::string bestPath_(std::uint32_t user_id) const;
  std::string historyPath_(std::uint32_t user_id) const;

  std::string dir_;
};

/**
 * @brief Разобрать текст истории.
 *
 * @return std::nullopt, если хотя бы одна непустая строка не разбирается
 */
std::optional<std::vector<AttemptResult>> parseHistory(const std::string& text);

/** @brief Сериализовать историю в формат файла `.history`. */
std::string serializeHistory(const std::vector<AttemptResult>& history);

}  // namespace bt

#endif  // BT_PROFILE_STORE_HPP
