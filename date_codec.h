#pragma once

#include <string>

#include "model.h"

namespace untis {

// 2025-05-21 -> 20250521, как ждёт WebUntis; год вне 0..9999 -> std::out_of_range
int encodeDate(const CalendarDate& date);

// Сдвиг на offsetDays календарных дней (может быть отрицательным).
// Слишком большой сдвиг -> std::out_of_range
CalendarDate applyOffset(const CalendarDate& baseDate, int offsetDays);

// Сегодняшняя дата по локальному времени
CalendarDate today();

bool isValidDate(const CalendarDate& date);

// "2025-05-21"
std::string formatDate(const CalendarDate& date);

// "Wednesday, 21 May 2025"
std::string formatLongDate(const CalendarDate& date);

} // namespace untis
