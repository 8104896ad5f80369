#include "filter.h"

#include <algorithm>

namespace untis {

bool hasGroupFilter(const std::optional<std::vector<std::string>>& filterGroups) {
    return filterGroups.has_value() && !filterGroups->empty();
}

std::string joinGroups(const std::vector<std::string>& groups) {
    std::string result;
    for (size_t i = 0; i < groups.size(); ++i) {
        result += groups[i];
        if (i + 1 != groups.size()) {
            result += ", ";
        }
    }
    return result;
}

std::vector<Row> filterRows(
    const std::vector<Row>& rows,
    const std::optional<std::vector<std::string>>& filterGroups
) {
    // пустой фильтр значит "показать всё", а не "ничего"
    if (!hasGroupFilter(filterGroups)) {
        return rows;
    }

    const std::vector<std::string>& groups = *filterGroups;

    std::vector<Row> result;
    for (const Row& row : rows) {
        if (std::find(groups.begin(), groups.end(), row.group) != groups.end()) {
            result.push_back(row);
        }
    }
    return result;
}

TimetablePayload applyGroupFilter(
    const TimetablePayload& payload,
    const std::optional<std::vector<std::string>>& filterGroups
) {
    TimetablePayload result;
    result.rows           = filterRows(payload.rows, filterGroups);
    result.absentElements = payload.absentElements; // отсутствующие учителя не относятся к классу
    result.lastUpdate     = payload.lastUpdate;
    result.extra          = payload.extra;
    return result;
}

} // namespace untis
