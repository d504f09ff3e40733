/**
 * @file bt_profile_store.cpp
 * @brief Файловое хранилище профилей
 *
 * Работа с файлами устроена так же, как хранение рекордов: каталог
 * создаётся при необходимости, файл открывается на полную перезапись,
 * ошибки чтения не прерывают игру.
 */

#include "bt_profile_store.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "../common/bt_common.h"

namespace bt {

/**
 * @brief Открывает хранилище в каталоге dir
 *
 * Каталог создаётся, если его нет. Ошибка создания только попадает в журнал:
 * последующие записи вернут false.
 */
FileProfileStore::FileProfileStore(std::string dir) : dir_(std::move(dir)) {
  if (!bt_ensure_dir(dir_.c_str())) {
    spdlog::error("cannot create {}: {}", dir_, std::strerror(errno));
  }
}

std::string FileProfileStore::bestPath_(std::uint32_t user_id) const {
  return dir_ + "/" + std::to_string(user_id) + ".best";
}

std::string FileProfileStore::historyPath_(std::uint32_t user_id) const {
  return dir_ + "/" + std::to_string(user_id) + ".history";
}

bool FileProfileStore::exists(std::uint32_t user_id) const noexcept {
  std::ifstream file(bestPath_(user_id));
  return file.is_open();
}

/**
 * @brief Закрепляет свободный идентификатор
 *
 * Новый профиль сразу записывается на диск: рекорд 0 и пустая история.
 *
 * @return false, если идентификатор занят или файлы не записаны
 */
bool FileProfileStore::claim(std::uint32_t user_id) noexcept {
  if (exists(user_id)) {
    spdlog::info("user id {} is already taken", user_id);
    return false;
  }
  if (!saveBest(user_id, 0) || !saveHistory(user_id, {})) {
    return false;
  }
  spdlog::info("claimed user id {}", user_id);
  return true;
}

/**
 * @brief Читает профиль игрока
 *
 * Профиль существует, если есть файл рекорда. Повреждённые данные не
 * прерывают загрузку:
 * - нечитаемый рекорд считается равным 0
 * - нечитаемая история заменяется пустой
 * В обоих случаях пишется предупреждение, следующая запись исправит файл.
 *
 * @return std::nullopt, если профиля нет
 */
std::optional<UserProfile> FileProfileStore::load(std::uint32_t user_id) const {
  std::ifstream best_file(bestPath_(user_id));
  if (!best_file.is_open()) {
    return std::nullopt;
  }

  UserProfile profile;
  profile.user_id = user_id;

  long long best = 0;
  if (!(best_file >> best) || best < 0 ||
      best > std::numeric_limits<std::uint32_t>::max()) {
    spdlog::warn("best score file for {} is malformed, using 0", user_id);
    best = 0;
  }
  profile.personal_best = static_cast<std::uint32_t>(best);

  std::ifstream history_file(historyPath_(user_id));
  if (history_file.is_open()) {
    std::ostringstream text;
    text << history_file.rdbuf();
    auto history = parseHistory(text.str());
    if (history) {
      profile.history = std::move(*history);
    } else {
      spdlog::warn("history for {} is malformed, starting empty", user_id);
    }
  }

  spdlog::info("loaded profile {}: best {}, {} attempts", user_id,
               profile.personal_best, profile.history.size());
  return profile;
}

// Файл перезаписывается целиком
bool FileProfileStore::saveBest(std::uint32_t user_id,
                                std::uint32_t level) noexcept {
  std::ofstream file(bestPath_(user_id), std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    spdlog::error("cannot write best score for {}", user_id);
    return false;
  }
  file << level << '\n';
  return static_cast<bool>(file);
}

bool FileProfileStore::saveHistory(
    std::uint32_t user_id, const std::vector<AttemptResult>& history) noexcept {
  std::ofstream file(historyPath_(user_id), std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    spdlog::error("cannot write history for {}", user_id);
    return false;
  }
  file << serializeHistory(history);
  return static_cast<bool>(file);
}

/**
 * @brief Разбирает файл истории
 *
 * Формат строки: `<уровень> <секунды> <0|1>`. Пустые строки пропускаются.
 *
 * @return std::nullopt, если хоть одна строка не разобрана
 */
std::optional<std::vector<AttemptResult>> parseHistory(const std::string& text) {
  std::vector<AttemptResult> history;
  std::istringstream in(text);
  std::string line;

  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    std::istringstream fields(line);
    long long level = 0;
    double seconds = 0.0;
    int completed = 0;
    std::string rest;
    if (!(fields >> level >> seconds >> completed) || (fields >> rest)) {
      return std::nullopt;
    }
    if (level < 0 || level > std::numeric_limits<std::uint32_t>::max() ||
        seconds < 0.0 || (completed != 0 && completed != 1)) {
      return std::nullopt;
    }

    AttemptResult result;
    result.level = static_cast<std::uint32_t>(level);
    result.elapsed_seconds = seconds;
    result.completed = completed == 1;
    history.push_back(result);
  }
  return history;
}

/** @brief Обратное к parseHistory(); секунды пишутся без потери точности. */
std::string serializeHistory(const std::vector<AttemptResult>& history) {
  std::ostringstream out;
  out.precision(std::numeric_limits<double>::max_digits10);
  for (const auto& result : history) {
    out << result.level << ' ' << result.elapsed_seconds << ' '
        << (result.completed ? 1 : 0) << '\n';
  }
  return out.str();
}

}  // namespace bt
