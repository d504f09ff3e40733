/**
 * @file bt_export.cpp
 * @brief Выгрузка истории попыток в CSV
 */

#include "bt_export.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace bt {

/**
 * @brief Текст CSV: заголовок и по строке на попытку
 *
 * Время округляется до двух знаков. Строки разделяются '\\n', в конце
 * перевода строки нет.
 *
 * @code
 * Level,Result,Time (s)
 * 1,Answered,2.50
 * 2,Gave Up,6.00
 * @endcode
 */
std::string formatCsv(const std::vector<AttemptResult>& history) {
  std::string csv = kCsvHeader;
  char time_buf[32];

  for (const auto& result : history) {
    std::snprintf(time_buf, sizeof(time_buf), "%.2f", result.elapsed_seconds);
    csv += '\n';
    csv += std::to_string(result.level);
    csv += ',';
    csv += result.completed ? kResultAnswered : kResultGaveUp;
    csv += ',';
    csv += time_buf;
  }
  return csv;
}

std::string exportFileName(std::uint32_t user_id) {
  return "tracking_history_" + std::to_string(user_id) + ".csv";
}

/**
 * @brief Записывает CSV в файл tracking_history_<id>.csv
 *
 * @param dir каталог назначения; пустая строка - временный каталог системы
 * @return полный путь файла или std::nullopt при ошибке (причина в журнале)
 */
std::optional<std::string> writeExport(std::uint32_t user_id,
                                       const std::string& csv,
                                       const std::string& dir) {
  namespace fs = std::filesystem;

  fs::path base = dir;
  if (base.empty()) {
    std::error_code ec;
    base = fs::temp_directory_path(ec);
    if (ec) {
      spdlog::error("no temporary directory for export: {}", ec.message());
      return std::nullopt;
    }
  }

  const fs::path path = base / exportFileName(user_id);
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    spdlog::error("cannot open {} for export", path.string());
    return std::nullopt;
  }
  file << csv;
  if (!file) {
    spdlog::error("export to {} failed", path.string());
    return std::nullopt;
  }

  spdlog::info("exported history of user {} to {}", user_id, path.string());
  return path.string();
}

}  // namespace bt
