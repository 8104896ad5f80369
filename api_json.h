#pragma once

#include <nlohmann/json.hpp>

#include "model.h"

namespace untis {

// payload из ответа WebUntis -> модель. Бросает ParseError.
TimetablePayload parsePayload(const nlohmann::json& j);

Row parseRow(const nlohmann::json& j);
AbsentElement parseAbsentElement(const nlohmann::json& j);

// Обратно в JSON (для --json), неизвестные поля payload сохраняются
nlohmann::json rowToJson(const Row& row);
nlohmann::json payloadToJson(const TimetablePayload& payload);

} // namespace untis
