#pragma once

#include <future>
#include <optional>
#include <string>

#include "errors.h"
#include "model.h"
#include "request_builder.h"

namespace untis {

// Ровно одно из двух заполнено
struct RetrievalResult {
    std::optional<TimetablePayload> payload;
    std::optional<RetrievalFailure> failure;

    bool ok() const { return payload.has_value(); }
};

// Запрос -> POST -> проверка -> фильтр; исключения не выходят, ошибка в failure
RetrievalResult retrieveTimetable(
    const SchoolIdentity& identity,
    const QueryOptions& options,
    const std::string& baseUrl = kDefaultBaseUrl
);

// То же в отдельной задаче
std::future<RetrievalResult> retrieveTimetableAsync(
    SchoolIdentity identity,
    QueryOptions options,
    std::string baseUrl = kDefaultBaseUrl
);

} // namespace untis
