#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "api_dto.h"

namespace untis {

// Текстовое табло для консоли
void renderBoard(
    std::ostream& out,
    const BoardView& board,
    const std::optional<std::vector<std::string>>& filterGroups
);

std::string formatRowLine(const RowView& row);

} // namespace untis
