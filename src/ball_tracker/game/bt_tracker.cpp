/**
 * @file bt_tracker.cpp
 * @brief C API обёртка для C++ реализации bt::TrackerGame
 *
 * Все функции объявлены как extern "C" и делегируют noexcept-методам, чтобы
 * исключения C++ не пересекали границу C.
 *
 * @note Реальная логика игры находится в bt_tracker_internals.cpp.
 * @see bt_tracker.h, bt_tracker_internals.hpp
 */

#include "../bt_tracker.h"
#include "bt_tracker_internals.hpp"

extern "C" {

void* tracker_create(unsigned user_id, const char* data_dir) {
  return bt::TrackerGame::create(user_id, data_dir);
}

void tracker_destroy(void* game) { bt::TrackerGame::destroy(game); }

void tracker_handle_input(void* game, UserAction_t action, bool hold) {
  bt::TrackerGame::handle_input(game, action, hold);
}

void tracker_tap(void* game, double x, double y) {
  bt::TrackerGame::tap(game, x, y);
}

void tracker_update(void* game) { bt::TrackerGame::update(game); }

const TrackerInfo_t* tracker_get_info(const void* game) {
  return bt::TrackerGame::get_info(game);
}

ExportResult_t tracker_export(const void* game, char* path,
                              size_t path_len) {
  return bt::TrackerGame::export_history(game, path, path_len);
}

}  // extern "C"
