#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "api_dto.h"
#include "api_json.h"
#include "config.h"
#include "date_codec.h"
#include "errors.h"
#include "logger.h"
#include "render.h"
#include "retrieval.h"

using namespace untis;

static void printUsage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [--date YYYY-MM-DD] [--offset N] [--days N] [--groups 11a,12] [--json]\n"
        << "Без --date и --groups спрашивает интерактивно.\n"
        << "Окружение: UNTIS_SCHOOL, UNTIS_FORMAT (обязательно), UNTIS_DEPARTMENTS,\n"
        << "           UNTIS_BASE_URL, UNTIS_LOG_FILE, UNTIS_LOG_LEVEL\n";
}

static bool parseIntArg(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static std::string ask(const std::string& question) {
    std::cout << question << std::flush;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

int main(int argc, char** argv) {
    QueryOptions options;
    bool asJson = false;
    bool interactive = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--json") {
            asJson = true;
        } else if (arg == "--date" && hasValue) {
            auto date = parseDate(argv[++i]);
            if (!date) {
                std::cerr << "Неверная дата: " << argv[i] << "\n";
                return 2;
            }
            options.targetDate = *date;
            interactive = false;
        } else if (arg == "--groups" && hasValue) {
            options.filterGroups = parseGroupList(argv[++i]);
            interactive = false;
        } else if (arg == "--offset" && hasValue) {
            if (!parseIntArg(argv[++i], options.dateOffset)) {
                std::cerr << "Неверное смещение: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--days" && hasValue) {
            if (!parseIntArg(argv[++i], options.numberOfDays) || options.numberOfDays < 1) {
                std::cerr << "Неверное число дней: " << argv[i] << "\n";
                return 2;
            }
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    ClientConfig cfg;
    try {
        cfg = ClientConfig::fromEnv();
    } catch (const ConfigurationError& ex) {
        std::cerr << "Ошибка конфигурации: " << ex.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }
    configureLogger(cfg.logger);

    if (interactive) {
        std::cout << "\n--- Запрос замен WebUntis ---\n";
        std::cout << "Оставьте поле пустым, чтобы взять значение по умолчанию.\n";

        std::string classInput = ask("Класс(ы) или курс(ы), например 11a или 12,13 (пусто = все): ");
        if (!trim(classInput).empty()) {
            options.filterGroups = parseGroupList(classInput);
        }

        std::string dateInput = ask("Дата в формате ГГГГ-ММ-ДД, например 2025-05-22 (пусто = сегодня): ");
        if (!trim(dateInput).empty()) {
            auto date = parseDate(dateInput);
            if (date) {
                options.targetDate = *date;
            } else {
                std::cout << "Неверная дата, используем сегодняшнюю.\n";
            }
        }
    }

    if (!options.targetDate) {
        options.targetDate = today();
    }
    CalendarDate queryDate{};
    try {
        queryDate = applyOffset(*options.targetDate, options.dateOffset);
    } catch (const std::out_of_range& ex) {
        std::cerr << "Неверное смещение: " << ex.what() << "\n";
        return 2;
    }

    std::cout << "\nЗапрос на: " << formatLongDate(queryDate)
              << " (" << options.numberOfDays << " дн.)\n";

    RetrievalResult result = retrieveTimetable(cfg.identity, options, cfg.baseUrl);
    if (!result.ok()) {
        const RetrievalFailure& f = *result.failure;
        std::cerr << "Не удалось получить расписание (" << failureKindName(f.kind) << "): "
                  << f.message << "\n";
        return 1;
    }

    if (asJson) {
        std::cout << payloadToJson(*result.payload).dump(2) << "\n";
    } else {
        renderBoard(std::cout, buildBoardView(*result.payload), options.filterGroups);
    }
    return 0;
}
