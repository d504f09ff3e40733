#pragma once

extern "C" {
#include "../common/view.h"   // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-интерфейса для BallTrack.
 *
 * Реализует контракт ViewInterface на Qt-виджетах. Зоны задаются в ячейках
 * VIEW_QT_CELL_W × VIEW_QT_CELL_H пикселей, шары рисуются кругами.
 *
 * @note Перед init() должен существовать QApplication.
 * @note Закрытие окна приходит в poll_input() как клавиша VIEW_KEY_ESCAPE.
 */
extern const ViewInterface qt_view;
