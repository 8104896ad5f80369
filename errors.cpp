#include "errors.h"

namespace untis {

std::string failureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::Configuration: return "configuration";
        case FailureKind::Transport:     return "transport";
        case FailureKind::Api:           return "api";
        case FailureKind::Parse:         return "parse";
    }
    return "unknown";
}

RetrievalFailure toFailure(const RetrievalError& err) {
    RetrievalFailure f;
    f.kind = err.kind();
    f.message = err.what();

    if (const auto* t = dynamic_cast<const TransportError*>(&err)) {
        f.httpStatus = t->status();
        f.bodyText = t->bodyText();
    } else if (const auto* a = dynamic_cast<const ApiError*>(&err)) {
        f.apiCode = a->code();
    }
    return f;
}

} // namespace untis
