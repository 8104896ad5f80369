#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace untis {

enum class FailureKind {
    Configuration,
    Transport,
    Api,
    Parse
};

std::string failureKindName(FailureKind kind);

class RetrievalError : public std::runtime_error {
public:
    RetrievalError(FailureKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

// Некорректная школа/опции, до любого сетевого запроса
class ConfigurationError : public RetrievalError {
public:
    explicit ConfigurationError(const std::string& msg)
        : RetrievalError(FailureKind::Configuration, msg) {}
};

// Нет соединения (status == 0) или HTTP статус вне 2xx
class TransportError : public RetrievalError {
public:
    explicit TransportError(const std::string& msg, int status = 0, std::string bodyText = "")
        : RetrievalError(FailureKind::Transport, msg),
          status_(status), bodyText_(std::move(bodyText)) {}

    int status() const { return status_; }
    const std::string& bodyText() const { return bodyText_; }

private:
    int status_;
    std::string bodyText_;
};

// Ответ 200, но внутри {"error": {...}}
class ApiError : public RetrievalError {
public:
    ApiError(int code, const std::string& message)
        : RetrievalError(FailureKind::Api, "WebUntis API error " + std::to_string(code) + ": " + message),
          code_(code), apiMessage_(message) {}

    int code() const { return code_; }
    const std::string& apiMessage() const { return apiMessage_; }

private:
    int code_;
    std::string apiMessage_;
};

class ParseError : public RetrievalError {
public:
    explicit ParseError(const std::string& msg)
        : RetrievalError(FailureKind::Parse, msg) {}
};

// То, что получает вызывающий код вместо исключения
struct RetrievalFailure {
    FailureKind kind;
    std::string message;
    int httpStatus = 0;
    std::string bodyText;
    std::optional<int> apiCode;
};

RetrievalFailure toFailure(const RetrievalError& err);

} // namespace untis
