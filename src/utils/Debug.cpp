#include "tiledash/utils/Debug.hpp"
#include <cstdlib>
#include <cstring>
#include <optional>

namespace tdash {

namespace {

std::optional<bool>& debugOverride() {
    static std::optional<bool> value;
    return value;
}

bool debugFromEnvironment() {
    static const bool enabled = [] {
        const char* value = std::getenv("TILEDASH_DEBUG");
        return value != nullptr && value[0] != '\0' && std::strcmp(value, "0") != 0;
    }();
    return enabled;
}

} // namespace

bool debugEnabled() {
    const auto& value = debugOverride();
    if (value.has_value()) {
        return *value;
    }
    return debugFromEnvironment();
}

void setDebugEnabled(bool enabled) {
    debugOverride() = enabled;
}

} // namespace tdash
