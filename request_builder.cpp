#include "request_builder.h"
#include "date_codec.h"
#include "errors.h"

#include <cstdio>
#include <stdexcept>

using nlohmann::json;

namespace untis {

static json makeDefaultFlags() {
    return json{
        {"strikethrough", true},
        {"mergeBlocks", true},
        {"showOnlyFutureSub", false},
        {"showBreakSupervisions", true},
        {"showTeacher", true},
        {"showClass", false},
        {"showHour", true},
        {"showInfo", true},
        {"showRoom", true},
        {"showSubject", true},
        {"groupBy", 1},
        {"hideAbsent", true},
        {"departmentElementType", 1},
        {"hideCancelWithSubstitution", true},
        {"hideCancelCausedByEvent", false},
        {"showTime", false},
        {"showSubstText", true},
        {"showAbsentElements", json::array({2})},
        {"showAffectedElements", json::array()},
        {"showUnitTime", true},
        {"showMessages", true},
        {"showStudentgroup", false},
        {"enableSubstitutionFrom", false},
        {"showSubstitutionFrom", 0},
        {"showTeacherOnEvent", false},
        {"showAbsentTeacher", false},
        {"strikethroughAbsentTeacher", true},
        {"activityTypeIds", json::array()},
        {"showEvent", true},
        {"showCancel", true},
        {"showOnlyCancel", false},
        {"showSubstTypeColor", false},
        {"showExamSupervision", false},
        {"showUnheraldedExams", false}
    };
}

const json& defaultFlags() {
    static const json flags = makeDefaultFlags();
    return flags;
}

std::string encodeUriComponent(const std::string& text) {
    static const std::string unreserved = "-_.!~*'()";

    std::string out;
    out.reserve(text.size() * 3);
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool keep = (uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') ||
                    (uc >= '0' && uc <= '9') || unreserved.find(c) != std::string::npos;
        if (keep) {
            out += c;
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", uc);
            out += buf;
        }
    }
    return out;
}

void validateIdentity(const SchoolIdentity& identity) {
    if (identity.schoolName.empty()) {
        throw ConfigurationError("schoolName is not set");
    }
    if (identity.formatName.empty()) {
        throw ConfigurationError("formatName is not set");
    }
}

static std::string joinUrl(const std::string& base, const std::string& endpoint) {
    if (!base.empty() && base.back() == '/') {
        return base + endpoint;
    }
    return base + "/" + endpoint;
}

OutboundRequest buildRequest(
    const SchoolIdentity& identity,
    const QueryOptions& options,
    const std::string& baseUrl
) {
    validateIdentity(identity);

    if (options.numberOfDays < 1) {
        throw ConfigurationError("numberOfDays must be positive, got " + std::to_string(options.numberOfDays));
    }

    CalendarDate base = options.targetDate ? *options.targetDate : today();
    if (!isValidDate(base)) {
        throw ConfigurationError("invalid target date " + formatDate(base));
    }

    OutboundRequest req;
    try {
        req.queryDate = applyOffset(base, options.dateOffset);
    } catch (const std::out_of_range& ex) {
        throw ConfigurationError(ex.what());
    }
    // WebUntis ждёт ровно четыре цифры года
    if (req.queryDate.year < kMinQueryYear || req.queryDate.year > kMaxQueryYear) {
        throw ConfigurationError("dateOffset " + std::to_string(options.dateOffset)
                                 + " gives year " + std::to_string(req.queryDate.year)
                                 + ", expected " + std::to_string(kMinQueryYear)
                                 + ".." + std::to_string(kMaxQueryYear));
    }

    // копия: общий набор флагов никогда не меняется
    json body = defaultFlags();

    body["schoolName"]    = identity.schoolName;
    body["formatName"]    = identity.formatName;
    body["departmentIds"] = identity.departmentIds;

    body["date"]         = encodeDate(req.queryDate);
    body["dateOffset"]   = options.dateOffset;
    body["numberOfDays"] = options.numberOfDays;

    req.body = std::move(body);
    req.url  = joinUrl(baseUrl, kSubstitutionEndpoint) + "?school=" + encodeUriComponent(identity.schoolName);
    return req;
}

} // namespace untis
