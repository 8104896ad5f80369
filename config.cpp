#include "config.h"
#include "date_codec.h"
#include "errors.h"
#include "request_builder.h"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace untis {

static std::string getEnvOrThrow(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " is not set";
        throw ConfigurationError(msg);
    }
    return std::string(val);
}

static std::string getEnvOr(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

ClientConfig ClientConfig::fromEnv() {
    ClientConfig cfg;
    cfg.identity.schoolName    = getEnvOrThrow("UNTIS_SCHOOL");
    cfg.identity.formatName    = getEnvOrThrow("UNTIS_FORMAT");
    cfg.identity.departmentIds = parseDepartmentIds(getEnvOr("UNTIS_DEPARTMENTS", ""));

    cfg.baseUrl = getEnvOr("UNTIS_BASE_URL", kDefaultBaseUrl);

    cfg.logger.filePath = getEnvOr("UNTIS_LOG_FILE", cfg.logger.filePath);
    cfg.logger.minLevel = parseLogLevel(getEnvOr("UNTIS_LOG_LEVEL", "info"));

    return cfg;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static std::vector<std::string> splitComma(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        parts.push_back(trim(token));
    }
    return parts;
}

std::vector<int> parseDepartmentIds(const std::string& text) {
    std::vector<int> ids;
    if (trim(text).empty()) {
        return ids;
    }

    for (const std::string& part : splitComma(text)) {
        size_t used = 0;
        int value = 0;
        try {
            value = std::stoi(part, &used);
        } catch (const std::exception&) {
            throw ConfigurationError("invalid department id '" + part + "'");
        }
        if (used != part.size()) {
            throw ConfigurationError("invalid department id '" + part + "'");
        }
        ids.push_back(value);
    }
    return ids;
}

std::vector<std::string> parseGroupList(const std::string& text) {
    std::vector<std::string> groups;
    for (const std::string& part : splitComma(text)) {
        if (!part.empty()) {
            groups.push_back(part);
        }
    }
    return groups;
}

static bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<CalendarDate> parseDate(const std::string& text) {
    std::string t = trim(text);

    size_t first = t.find('-');
    size_t second = (first == std::string::npos) ? std::string::npos : t.find('-', first + 1);
    if (second == std::string::npos || t.find('-', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string y = t.substr(0, first);
    std::string m = t.substr(first + 1, second - first - 1);
    std::string d = t.substr(second + 1);
    if (!allDigits(y) || !allDigits(m) || !allDigits(d) || y.size() != 4 || m.size() > 2 || d.size() > 2) {
        return std::nullopt;
    }

    CalendarDate date{std::stoi(y), std::stoi(m), std::stoi(d)};
    if (!isValidDate(date)) {
        return std::nullopt;
    }
    return date;
}

} // namespace untis
