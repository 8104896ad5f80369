#include "retrieval.h"
#include "date_codec.h"
#include "filter.h"
#include "logger.h"
#include "transport.h"

#include <system_error>
#include <utility>

namespace untis {

static RetrievalResult failWith(const RetrievalError& err) {
    RetrievalFailure f = toFailure(err);

    std::string msg = "[" + failureKindName(f.kind) + "] " + f.message;
    if (f.kind == FailureKind::Transport && f.httpStatus != 0) {
        msg += " (status " + std::to_string(f.httpStatus) + ")";
    }
    logError(msg);

    RetrievalResult r;
    r.failure = std::move(f);
    return r;
}

RetrievalResult retrieveTimetable(
    const SchoolIdentity& identity,
    const QueryOptions& options,
    const std::string& baseUrl
) {
    try {
        OutboundRequest req = buildRequest(identity, options, baseUrl);

        logInfo("Запрос на " + formatDate(req.queryDate)
                + " (" + std::to_string(options.numberOfDays) + " дн.): " + req.url);
        if (hasGroupFilter(options.filterGroups)) {
            logInfo("Фильтр по классам: " + joinGroups(*options.filterGroups));
        }
        logDebug("Тело запроса: " + req.body.dump(2));

        TimetablePayload raw = fetchTimetable(req.url, req.body);
        TimetablePayload result = applyGroupFilter(raw, options.filterGroups);

        logInfo("Данные получены: строк " + std::to_string(raw.rows.size())
                + ", после фильтра " + std::to_string(result.rows.size())
                + ", отсутствующих " + std::to_string(result.absentElements.size()));

        RetrievalResult r;
        r.payload = std::move(result);
        return r;
    } catch (const RetrievalError& ex) {
        return failWith(ex);
    } catch (const std::exception& ex) {
        // json::type_error и т.п. при разборе ответа
        return failWith(ParseError(std::string("unexpected error: ") + ex.what()));
    }
}

std::future<RetrievalResult> retrieveTimetableAsync(
    SchoolIdentity identity,
    QueryOptions options,
    std::string baseUrl
) {
    try {
        return std::async(std::launch::async,
            [identity = std::move(identity), options = std::move(options), baseUrl = std::move(baseUrl)]() {
                return retrieveTimetable(identity, options, baseUrl);
            });
    } catch (const std::system_error& ex) {
        // поток не создался: сразу готовый future с ошибкой
        std::promise<RetrievalResult> failed;
        failed.set_value(failWith(TransportError(std::string("cannot start request task: ") + ex.what())));
        return failed.get_future();
    }
}

} // namespace untis
