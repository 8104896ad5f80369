#pragma once

#include <string>
#include <utility>
#include <vector>

#include "model.h"

namespace untis {

// Стиль ячейки предмета (индекс "1"), которым WebUntis помечает отмену
constexpr const char* kCancelStyle = "cancelStyle";
constexpr const char* kUnknownGroup = "Неизвестная группа";
constexpr const char* kNotAvailable = "N/A";
constexpr const char* kUnknownElement = "Unknown";

struct RowView {
    std::string hour;
    std::string subject;
    std::string room;
    std::string teacher;
    std::string info;       // без html-тегов, может быть пустой
    bool cancelled;
};

struct GroupView {
    std::string groupName;
    std::vector<Row> rows;
};

struct AbsentView {
    std::string name;
    std::string type;       // тип первой записи об отсутствии
};

struct BoardView {
    std::string lastUpdate;
    std::vector<std::pair<std::string, std::vector<RowView>>> groups;
    std::vector<AbsentView> absent;
};

// "Room <b>changed</b>" -> "Room changed"
std::string stripTags(const std::string& text);

bool isCancelled(const Row& row);

// Группы по возрастанию имени, без класса -> kUnknownGroup, порядок строк исходный
std::vector<GroupView> groupByClass(const std::vector<Row>& rows);

RowView derivePresentation(const Row& row);

AbsentView describeAbsentElement(const AbsentElement& element);

BoardView buildBoardView(const TimetablePayload& payload);

} // namespace untis
