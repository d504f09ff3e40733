/**
 * @file bt_export.hpp
 * @brief Экспорт истории попыток в CSV
 */

#ifndef BT_EXPORT_HPP
#define BT_EXPORT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bt_profile_store.hpp"

namespace bt {

inline constexpr const char* kCsvHeader = "Level,Result,Time (s)";
inline constexpr const char* kResultAnswered = "Answered";
inline constexpr const char* kResultGaveUp = "Gave Up";

/**
 * @brief Отформатировать историю в CSV.
 *
 * Заголовок и по строке на попытку в порядке хранения, поля через
 * запятую, время с двумя знаками после точки. Строки разделены `\n`,
 * завершающего перевода строки нет.
 *
 * @code
 * formatCsv({{1, 2.5, true}, {1, 4.1, false}});
 * // "Level,Result,Time (s)\n1,Answered,2.50\n1,Gave Up,4.10"
 * @endcode
 */
std::string formatCsv(const std::vector<AttemptResult>& history);

/** @brief Имя файла экспорта: `tracking_history_<id>.csv`. */
std::string exportFileName(std::uint32_t user_id);

/**
 * @brief Записать CSV в каталог dir (по умолчанию - временный каталог).
 *
 * @return путь записанного файла или std::nullopt при ошибке
 */
std::optional<std::string> writeExport(std::uint32_t user_id,
                                       const std::string& csv,
                                       const std::string& dir = {});

}  // namespace bt

#endif  // BT_EXPORT_HPP
