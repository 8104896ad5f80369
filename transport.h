#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model.h"

namespace untis {

struct HttpTarget {
    std::string origin; // "https://host:port"
    std::string path;   // "/WebUntis/...?school=..."
};

// Делит абсолютный URL на часть для httplib::Client и путь запроса
HttpTarget splitUrl(const std::string& url);

// не 2xx -> TransportError, не JSON -> ParseError, {"error":...} -> ApiError
TimetablePayload interpretResponse(int status, const std::string& bodyText);

// Один POST на монитор, без повторов и кэша
TimetablePayload fetchTimetable(const std::string& url, const nlohmann::json& body);

} // namespace untis
