#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model.h"

namespace untis {

// Только строки нужных классов (точное сравнение); без фильтра - все строки
std::vector<Row> filterRows(
    const std::vector<Row>& rows,
    const std::optional<std::vector<std::string>>& filterGroups
);

// rows фильтруются, absentElements и остальное копируются как есть
TimetablePayload applyGroupFilter(
    const TimetablePayload& payload,
    const std::optional<std::vector<std::string>>& filterGroups
);

bool hasGroupFilter(const std::optional<std::vector<std::string>>& filterGroups);

// {"11a", "12"} -> "11a, 12"
std::string joinGroups(const std::vector<std::string>& groups);

} // namespace untis
