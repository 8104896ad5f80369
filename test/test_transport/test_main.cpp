#include <unity.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <thread>

#include "errors.h"
#include "logger.h"
#include "retrieval.h"
#include "transport.h"

using namespace untis;
using nlohmann::json;

void setUp() {}
void tearDown() {}

// --- локальный "WebUntis" на 127.0.0.1 ---

static httplib::Server svr;
static int port = 0;
static std::mutex lastMutex;
static json lastBody;
static std::string lastRequestedWith;
static std::string lastSchoolParam;

static const char* kBoardJson = R"({
    "payload": {
        "date": 20250522,
        "lastUpdate": "22.05.2025 07:12",
        "rows": [
            {"group": "12", "data": ["1", "M", "101", "ABC", ""], "cellClasses": []},
            {"group": "11a", "data": ["2", "D", "204", "SCH", "Raum <b>geändert</b>"], "cellClasses": {"1": ["cancelStyle"]}},
            {"group": "11a", "data": ["3", "E", null, "MUE", ""]},
            {"data": ["4", "SP", "TH", "KLE", ""]}
        ],
        "absentElements": [
            {"elementName": "MUE", "absences": [{"type": "Krank", "from": 800}]}
        ],
        "messageData": {"messages": []}
    }
})";

static std::string baseUrl(const std::string& context)
{
    return "http://127.0.0.1:" + std::to_string(port) + context;
}

static void startServer()
{
    svr.Post("/ok/monitor/substitution/data", [](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(lastMutex);
        lastBody = json::parse(req.body);
        lastRequestedWith = req.get_header_value("X-Requested-With");
        lastSchoolParam = req.get_param_value("school");
        res.set_content(kBoardJson, "application/json; charset=utf-8");
    });

    svr.Post("/apierr/monitor/substitution/data", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content(R"({"error":{"code":-1,"message":"not found"}})", "application/json");
    });

    svr.Post("/down/monitor/substitution/data", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content("maintenance", "text/plain");
    });

    svr.Post("/html/monitor/substitution/data", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("<html>login</html>", "text/html");
    });

    port = svr.bind_to_any_port("127.0.0.1");
}

static SchoolIdentity testSchool()
{
    return SchoolIdentity{"Test School", "Fmt", {1}};
}

// --- interpretResponse без сети ---

void test_error_envelope_with_status_200_is_api_error()
{
    bool thrown = false;
    try {
        interpretResponse(200, R"({"error":{"code":-1,"message":"not found"}})");
    } catch (const ApiError& ex) {
        thrown = true;
        TEST_ASSERT_EQUAL_INT(-1, ex.code());
        TEST_ASSERT_EQUAL_STRING("not found", ex.apiMessage().c_str());
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_non_success_status_is_transport_error_with_body()
{
    bool thrown = false;
    try {
        interpretResponse(500, "Internal Server Error");
    } catch (const TransportError& ex) {
        thrown = true;
        TEST_ASSERT_EQUAL_INT(500, ex.status());
        TEST_ASSERT_EQUAL_STRING("Internal Server Error", ex.bodyText().c_str());
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_invalid_json_is_parse_error()
{
    bool thrown = false;
    try {
        interpretResponse(200, "<html>");
    } catch (const ParseError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_missing_payload_is_parse_error()
{
    bool thrown = false;
    try {
        interpretResponse(200, R"({"something":1})");
    } catch (const ParseError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_success_envelope_is_decoded()
{
    TimetablePayload p = interpretResponse(200, kBoardJson);

    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(p.rows.size()));
    TEST_ASSERT_EQUAL_STRING("22.05.2025 07:12", p.lastUpdate.c_str());
    TEST_ASSERT_FALSE(p.rows[0].cellClasses.has_value());
    TEST_ASSERT_TRUE(p.rows[1].cellClasses.has_value());
    TEST_ASSERT_EQUAL_STRING("", p.rows[2].data[2].c_str());
    TEST_ASSERT_EQUAL_STRING("", p.rows[3].group.c_str());
    TEST_ASSERT_EQUAL_STRING("Krank", p.absentElements[0].absences[0].type.c_str());
    TEST_ASSERT_EQUAL_INT(800, p.absentElements[0].absences[0].raw["from"].get<int>());
    TEST_ASSERT_TRUE(p.extra.contains("messageData"));
    TEST_ASSERT_TRUE(p.extra.contains("date"));
}

void test_split_url()
{
    HttpTarget t = splitUrl("https://nessa.webuntis.com/WebUntis/monitor/substitution/data?school=A%20B");
    TEST_ASSERT_EQUAL_STRING("https://nessa.webuntis.com", t.origin.c_str());
    TEST_ASSERT_EQUAL_STRING("/WebUntis/monitor/substitution/data?school=A%20B", t.path.c_str());

    HttpTarget bare = splitUrl("http://localhost:8080");
    TEST_ASSERT_EQUAL_STRING("/", bare.path.c_str());
}

// --- полный цикл через httplib ---

void test_retrieve_filters_rows_and_keeps_absent()
{
    QueryOptions opt;
    opt.targetDate = CalendarDate{2025, 5, 21};
    opt.dateOffset = 1;
    opt.filterGroups = std::vector<std::string>{"11a"};

    RetrievalResult r = retrieveTimetable(testSchool(), opt, baseUrl("/ok"));

    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_FALSE(r.failure.has_value());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(r.payload->rows.size()));
    for (const Row& row : r.payload->rows) {
        TEST_ASSERT_EQUAL_STRING("11a", row.group.c_str());
    }
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(r.payload->absentElements.size()));

    std::lock_guard<std::mutex> lock(lastMutex);
    TEST_ASSERT_EQUAL_INT(20250522, lastBody["date"].get<int>());
    TEST_ASSERT_EQUAL_STRING("Fmt", lastBody["formatName"].get<std::string>().c_str());
    TEST_ASSERT_TRUE(lastBody["strikethrough"].get<bool>());
    TEST_ASSERT_EQUAL_STRING("XMLHttpRequest", lastRequestedWith.c_str());
    TEST_ASSERT_EQUAL_STRING("Test School", lastSchoolParam.c_str());
}

void test_retrieve_without_filter_returns_everything()
{
    QueryOptions opt;
    opt.targetDate = CalendarDate{2025, 5, 21};

    RetrievalResult r = retrieveTimetable(testSchool(), opt, baseUrl("/ok"));
    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(r.payload->rows.size()));
}

void test_retrieve_api_error()
{
    RetrievalResult r = retrieveTimetable(testSchool(), QueryOptions{}, baseUrl("/apierr"));

    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_TRUE(r.failure->kind == FailureKind::Api);
    TEST_ASSERT_TRUE(r.failure->apiCode.has_value());
    TEST_ASSERT_EQUAL_INT(-1, *r.failure->apiCode);
}

void test_retrieve_http_error_carries_body()
{
    RetrievalResult r = retrieveTimetable(testSchool(), QueryOptions{}, baseUrl("/down"));

    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_TRUE(r.failure->kind == FailureKind::Transport);
    TEST_ASSERT_EQUAL_INT(503, r.failure->httpStatus);
    TEST_ASSERT_EQUAL_STRING("maintenance", r.failure->bodyText.c_str());
}

void test_retrieve_non_json_body_is_parse_failure()
{
    RetrievalResult r = retrieveTimetable(testSchool(), QueryOptions{}, baseUrl("/html"));

    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_TRUE(r.failure->kind == FailureKind::Parse);
}

void test_retrieve_connection_refused()
{
    // порт 1 никто не слушает
    RetrievalResult r = retrieveTimetable(testSchool(), QueryOptions{}, "http://127.0.0.1:1/WebUntis");

    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_TRUE(r.failure->kind == FailureKind::Transport);
    TEST_ASSERT_EQUAL_INT(0, r.failure->httpStatus);
}

void test_retrieve_bad_identity_never_hits_network()
{
    SchoolIdentity id = testSchool();
    id.formatName = "";

    RetrievalResult r = retrieveTimetable(id, QueryOptions{}, "http://127.0.0.1:1/WebUntis");
    TEST_ASSERT_FALSE(r.ok());
    TEST_ASSERT_TRUE(r.failure->kind == FailureKind::Configuration);
}

void test_async_calls_run_independently()
{
    QueryOptions a;
    a.targetDate = CalendarDate{2025, 5, 21};
    a.filterGroups = std::vector<std::string>{"12"};

    auto f1 = retrieveTimetableAsync(testSchool(), a, baseUrl("/ok"));
    auto f2 = retrieveTimetableAsync(testSchool(), QueryOptions{}, baseUrl("/down"));

    RetrievalResult r1 = f1.get();
    RetrievalResult r2 = f2.get();

    TEST_ASSERT_TRUE(r1.ok());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(r1.payload->rows.size()));
    TEST_ASSERT_FALSE(r2.ok());
    TEST_ASSERT_EQUAL_INT(503, r2.failure->httpStatus);
}

int main()
{
    configureLogger(LoggerSettings{"", LogLevel::Error});

    startServer();
    if (port <= 0) {
        return 1;
    }
    std::thread serverThread([] { svr.listen_after_bind(); });

    UNITY_BEGIN();
    RUN_TEST(test_error_envelope_with_status_200_is_api_error);
    RUN_TEST(test_non_success_status_is_transport_error_with_body);
    RUN_TEST(test_invalid_json_is_parse_error);
    RUN_TEST(test_missing_payload_is_parse_error);
    RUN_TEST(test_success_envelope_is_decoded);
    RUN_TEST(test_split_url);
    RUN_TEST(test_retrieve_filters_rows_and_keeps_absent);
    RUN_TEST(test_retrieve_without_filter_returns_everything);
    RUN_TEST(test_retrieve_api_error);
    RUN_TEST(test_retrieve_http_error_carries_body);
    RUN_TEST(test_retrieve_non_json_body_is_parse_failure);
    RUN_TEST(test_retrieve_connection_refused);
    RUN_TEST(test_retrieve_bad_identity_never_hits_network);
    RUN_TEST(test_async_calls_run_independently);
    int failures = UNITY_END();

    svr.stop();
    serverThread.join();
    return failures;
}
