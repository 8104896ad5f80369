#include "transport.h"
#include "api_json.h"
#include "errors.h"
#include "logger.h"

#include <httplib.h>

using nlohmann::json;

namespace untis {

HttpTarget splitUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw TransportError("URL without scheme: " + url);
    }

    size_t pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        return HttpTarget{url, "/"};
    }
    return HttpTarget{url.substr(0, pathStart), url.substr(pathStart)};
}

TimetablePayload interpretResponse(int status, const std::string& bodyText) {
    if (status < 200 || status > 299) {
        throw TransportError(
            "HTTP error " + std::to_string(status) + ": " + bodyText,
            status,
            bodyText
        );
    }

    json data;
    try {
        data = json::parse(bodyText);
    } catch (const json::parse_error& ex) {
        throw ParseError(std::string("response is not valid JSON: ") + ex.what());
    }

    if (!data.is_object()) {
        throw ParseError("response is not a JSON object");
    }

    // сервер отдаёт доменные ошибки со статусом 200
    auto itError = data.find("error");
    if (itError != data.end() && !itError->is_null()) {
        int code = 0;
        std::string message;
        if (itError->is_object()) {
            auto itCode = itError->find("code");
            if (itCode != itError->end() && itCode->is_number_integer()) {
                code = itCode->get<int>();
            }
            auto itMessage = itError->find("message");
            if (itMessage != itError->end()) {
                message = itMessage->is_string() ? itMessage->get<std::string>() : itMessage->dump();
            }
        } else {
            message = itError->dump();
        }
        throw ApiError(code, message);
    }

    auto itPayload = data.find("payload");
    if (itPayload == data.end() || !itPayload->is_object()) {
        throw ParseError("response has no payload object");
    }

    return parsePayload(*itPayload);
}

TimetablePayload fetchTimetable(const std::string& url, const json& body) {
    HttpTarget target = splitUrl(url);

    httplib::Client cli(target.origin);

    httplib::Headers headers = {
        {"Accept", "*/*"},
        {"X-Requested-With", "XMLHttpRequest"}
    };

    auto res = cli.Post(target.path, headers, body.dump(), "application/json");
    if (!res) {
        throw TransportError("request to " + target.origin + " failed: " + httplib::to_string(res.error()));
    }

    logDebug("HTTP " + std::to_string(res->status) + " from " + target.origin
             + " (" + std::to_string(res->body.size()) + " bytes)");

    return interpretResponse(res->status, res->body);
}

} // namespace untis
