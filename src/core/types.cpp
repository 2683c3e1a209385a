#include <rangeio/core/types.h>

namespace rangeio {

std::string ResponseError::describe() const {
    std::string out = "[" + code + "]: " + message;
    return out;
}

std::string Error::describe() const {
    std::string out = message;
    if (out.empty())
        out = errorToString(code);
    if (cause) {
        out.append(": ");
        out.append(cause->describe());
    }
    return out;
}

Error wrapError(ErrorCode code, std::string message, Error cause) {
    Error err;
    err.code = code;
    err.message = std::move(message);
    err.cause = std::make_shared<const Error>(std::move(cause));
    return err;
}

const Error& rootCause(const Error& error) {
    const Error* current = &error;
    while (current->cause)
        current = current->cause.get();
    return *current;
}

} // namespace rangeio
