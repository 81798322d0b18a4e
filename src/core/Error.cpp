#include "tiledash/core/Error.hpp"

namespace tdash {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::GeometryError: return "GeometryError";
        default: return "UnknownError";
    }
}

std::string Error::toString() const {
    std::string out = errorKindToString(kind);
    if (!container_id.empty()) {
        out += " in container \"" + container_id + "\"";
    }
    out += ": " + message;
    return out;
}

Error configurationError(std::string message, std::string container_id) {
    return Error{ErrorKind::ConfigurationError, std::move(message), std::move(container_id)};
}

Error geometryError(std::string message, std::string container_id) {
    return Error{ErrorKind::GeometryError, std::move(message), std::move(container_id)};
}

} // namespace tdash
