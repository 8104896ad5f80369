#include "api_dto.h"

#include <algorithm>
#include <map>

namespace untis {

static std::string orNotAvailable(const std::string& s) {
    return s.empty() ? kNotAvailable : s;
}

std::string stripTags(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('<', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        size_t close = text.find('>', open + 1);
        if (close == std::string::npos) {
            // незакрытый '<' тегом не считается
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        pos = close + 1;
    }
    return out;
}

bool isCancelled(const Row& row) {
    if (!row.cellClasses) {
        return false;
    }
    auto it = row.cellClasses->find("1");
    if (it == row.cellClasses->end()) {
        return false;
    }
    const std::vector<std::string>& tags = it->second;
    return std::find(tags.begin(), tags.end(), kCancelStyle) != tags.end();
}

std::vector<GroupView> groupByClass(const std::vector<Row>& rows) {
    std::map<std::string, std::vector<Row>> buckets;
    for (const Row& row : rows) {
        const std::string& name = row.group.empty() ? std::string(kUnknownGroup) : row.group;
        buckets[name].push_back(row);
    }

    std::vector<GroupView> result;
    result.reserve(buckets.size());
    for (auto& b : buckets) {
        result.push_back(GroupView{b.first, std::move(b.second)});
    }
    return result;
}

RowView derivePresentation(const Row& row) {
    RowView v;
    v.hour      = orNotAvailable(row.data[CellHour]);
    v.subject   = orNotAvailable(row.data[CellSubject]);
    v.room      = orNotAvailable(row.data[CellRoom]);
    v.teacher   = orNotAvailable(row.data[CellTeacher]);
    v.info      = stripTags(row.data[CellInfo]);
    v.cancelled = isCancelled(row);
    return v;
}

AbsentView describeAbsentElement(const AbsentElement& element) {
    AbsentView v;
    v.name = element.elementName.empty() ? kUnknownElement : element.elementName;
    if (!element.absences.empty() && !element.absences.front().type.empty()) {
        v.type = element.absences.front().type;
    } else {
        v.type = kNotAvailable;
    }
    return v;
}

BoardView buildBoardView(const TimetablePayload& payload) {
    BoardView board;
    board.lastUpdate = payload.lastUpdate;

    for (const GroupView& g : groupByClass(payload.rows)) {
        std::vector<RowView> views;
        views.reserve(g.rows.size());
        for (const Row& r : g.rows) {
            views.push_back(derivePresentation(r));
        }
        board.groups.emplace_back(g.groupName, std::move(views));
    }

    for (const AbsentElement& a : payload.absentElements) {
        board.absent.push_back(describeAbsentElement(a));
    }
    return board;
}

} // namespace untis
