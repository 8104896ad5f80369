#include "render.h"
#include "filter.h"

namespace untis {

std::string formatRowLine(const RowView& row) {
    std::string line = "  " + row.hour + " | " + row.subject + " | " + row.room + " | " + row.teacher;
    if (!row.info.empty()) {
        line += " | Info: " + row.info;
    }
    if (row.cancelled) {
        line += " (ОТМЕНА)";
    }
    return line;
}

void renderBoard(
    std::ostream& out,
    const BoardView& board,
    const std::optional<std::vector<std::string>>& filterGroups
) {
    if (board.groups.empty()) {
        out << "Нет записей на этот день или для выбранных классов.\n";
    } else {
        out << "\n--- Замены ---\n";
        out << "Обновлено: " << board.lastUpdate << "\n";
        if (hasGroupFilter(filterGroups)) {
            out << "(только классы: " << joinGroups(*filterGroups) << ")\n";
        }

        for (const auto& group : board.groups) {
            out << "\n--- Класс: " << group.first << " ---\n";
            for (const RowView& row : group.second) {
                out << formatRowLine(row) << "\n";
            }
        }
    }

    // отсутствующие показываются всегда, фильтр по классам их не касается
    if (!board.absent.empty()) {
        out << "\n--- Отсутствуют (без фильтра) ---\n";
        for (const AbsentView& a : board.absent) {
            out << "- " << a.name << " (" << a.type << ")\n";
        }
    }
}

} // namespace untis
