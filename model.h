#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace untis {

struct CalendarDate {
    int year;
    int month; // 1..12
    int day;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const CalendarDate& a, const CalendarDate& b) {
    return !(a == b);
}

// Школа на мониторе WebUntis
struct SchoolIdentity {
    std::string schoolName;
    std::string formatName;
    std::vector<int> departmentIds;
};

struct QueryOptions {
    std::optional<CalendarDate> targetDate;   // нет = сегодня
    int dateOffset = 0;
    int numberOfDays = 1;
    std::optional<std::vector<std::string>> filterGroups; // нет/пусто = все классы
};

// Индекс ячейки в Row::data
enum RowCell {
    CellHour = 0,
    CellSubject = 1,
    CellRoom = 2,
    CellTeacher = 3,
    CellInfo = 4
};

struct Row {
    std::string group;                  // "" если класса нет
    std::array<std::string, 5> data;    // час, предмет, кабинет, учитель, инфо
    std::optional<std::map<std::string, std::vector<std::string>>> cellClasses;
};

struct Absence {
    std::string type;
    nlohmann::json raw; // вся запись как пришла
};

struct AbsentElement {
    std::string elementName;
    std::vector<Absence> absences;
};

struct TimetablePayload {
    std::vector<Row> rows;
    std::vector<AbsentElement> absentElements;
    std::string lastUpdate;
    nlohmann::json extra = nlohmann::json::object(); // остальные поля payload
};

} // namespace untis
