#include "api_json.h"
#include "errors.h"

#include <algorithm>

using nlohmann::json;

namespace untis {

// null -> "", строка как есть, числа и прочее -> JSON-текст
static std::string cellText(const json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

static std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return "";
    return cellText(*it);
}

Row parseRow(const json& j) {
    if (!j.is_object()) {
        throw ParseError("row is not an object");
    }

    Row row;
    row.group = stringField(j, "group");

    auto itData = j.find("data");
    if (itData != j.end() && itData->is_array()) {
        size_t n = std::min(itData->size(), row.data.size());
        for (size_t i = 0; i < n; ++i) {
            row.data[i] = cellText((*itData)[i]);
        }
    }

    // пустые cellClasses сервер присылает как [], это "нет стилей"
    auto itClasses = j.find("cellClasses");
    if (itClasses != j.end() && itClasses->is_object()) {
        std::map<std::string, std::vector<std::string>> classes;
        for (auto it = itClasses->begin(); it != itClasses->end(); ++it) {
            std::vector<std::string> tags;
            if (it.value().is_array()) {
                for (const json& tag : it.value()) {
                    if (tag.is_string()) tags.push_back(tag.get<std::string>());
                }
            }
            classes[it.key()] = std::move(tags);
        }
        row.cellClasses = std::move(classes);
    }

    return row;
}

AbsentElement parseAbsentElement(const json& j) {
    if (!j.is_object()) {
        throw ParseError("absent element is not an object");
    }

    AbsentElement el;
    el.elementName = stringField(j, "elementName");

    auto itAbs = j.find("absences");
    if (itAbs != j.end() && itAbs->is_array()) {
        for (const json& a : *itAbs) {
            Absence absence;
            absence.type = a.is_object() ? stringField(a, "type") : "";
            absence.raw  = a;
            el.absences.push_back(std::move(absence));
        }
    }
    return el;
}

TimetablePayload parsePayload(const json& j) {
    if (!j.is_object()) {
        throw ParseError("payload is not an object");
    }

    auto itRows = j.find("rows");
    if (itRows == j.end() || !itRows->is_array()) {
        throw ParseError("payload.rows is missing or not an array");
    }

    TimetablePayload payload;
    for (const json& r : *itRows) {
        payload.rows.push_back(parseRow(r));
    }

    auto itAbsent = j.find("absentElements");
    if (itAbsent != j.end() && itAbsent->is_array()) {
        for (const json& a : *itAbsent) {
            payload.absentElements.push_back(parseAbsentElement(a));
        }
    }

    payload.lastUpdate = stringField(j, "lastUpdate");

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "rows" || it.key() == "absentElements" || it.key() == "lastUpdate") {
            continue;
        }
        payload.extra[it.key()] = it.value();
    }

    return payload;
}

json rowToJson(const Row& row) {
    json j;
    j["group"] = row.group;
    j["data"]  = row.data;
    if (row.cellClasses) {
        j["cellClasses"] = *row.cellClasses;
    }
    return j;
}

json payloadToJson(const TimetablePayload& payload) {
    json j = payload.extra;

    json rows = json::array();
    for (const Row& r : payload.rows) {
        rows.push_back(rowToJson(r));
    }

    json absent = json::array();
    for (const AbsentElement& a : payload.absentElements) {
        json absences = json::array();
        for (const Absence& abs : a.absences) {
            absences.push_back(abs.raw);
        }
        absent.push_back({
            {"elementName", a.elementName},
            {"absences", absences}
        });
    }

    j["rows"]           = rows;
    j["absentElements"] = absent;
    j["lastUpdate"]     = payload.lastUpdate;
    return j;
}

} // namespace untis
