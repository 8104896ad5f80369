#pragma once

#include <optional>
#include <string>
#include <vector>

#include "logger.h"
#include "model.h"

namespace untis {

// --- Настройки клиента из окружения ---
struct ClientConfig {
    SchoolIdentity identity;
    std::string    baseUrl;
    LoggerSettings logger;

    // UNTIS_SCHOOL, UNTIS_FORMAT обязательны; бросает ConfigurationError
    static ClientConfig fromEnv();
};

std::string trim(const std::string& s);

// "2, 1,3" -> {2, 1, 3}; пустая строка -> {}; мусор -> ConfigurationError
std::vector<int> parseDepartmentIds(const std::string& text);

// "11a, 12,,13" -> {"11a", "12", "13"}
std::vector<std::string> parseGroupList(const std::string& text);

// "2025-05-22" -> дата; неверный формат или несуществующий день -> nullopt
std::optional<CalendarDate> parseDate(const std::string& text);

} // namespace untis
