#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model.h"

namespace untis {

// Боевой сервер монитора (host + context path)
constexpr const char* kDefaultBaseUrl = "https://nessa.webuntis.com/WebUntis";
constexpr const char* kSubstitutionEndpoint = "monitor/substitution/data";

// Допустимый год даты запроса (YYYYMMDD)
constexpr int kMinQueryYear = 1000;
constexpr int kMaxQueryYear = 9999;

struct OutboundRequest {
    std::string url;
    nlohmann::json body;
    CalendarDate queryDate;
};

// Флаги отображения монитора, уходят в каждом запросе без изменений
const nlohmann::json& defaultFlags();

// Как encodeURIComponent: всё кроме A-Z a-z 0-9 - _ . ! ~ * ' ( ) -> %XX
std::string encodeUriComponent(const std::string& text);

// Бросает ConfigurationError, сеть не трогает
void validateIdentity(const SchoolIdentity& identity);

// URL и тело запроса: defaultFlags() < identity < дата; ошибки -> ConfigurationError
OutboundRequest buildRequest(
    const SchoolIdentity& identity,
    const QueryOptions& options,
    const std::string& baseUrl = kDefaultBaseUrl
);

} // namespace untis
