#include "tiledash/core/Types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace tdash {

namespace {

const std::unordered_map<std::string, Key>& namedKeys() {
    // Upper-case names, lookups convert the input first
    static const std::unordered_map<std::string, Key> key_map = {
        {"BACKSPACE", keys::Backspace},
        {"TAB", keys::Tab},
        {"BACKTAB", keys::BackTab},
        {"RETURN", keys::Enter},
        {"ENTER", keys::Enter},
        {"ESC", keys::Esc},
        {"ESCAPE", keys::Esc},
        {"SPACE", keys::Space},
        {"DELETE", keys::Delete},
        {"INSERT", keys::Insert},
        {"HOME", keys::Home},
        {"END", keys::End},
        {"PAGEUP", keys::PageUp},
        {"PGUP", keys::PageUp},
        {"PAGEDOWN", keys::PageDown},
        {"PGDN", keys::PageDown},
        {"UP", keys::ArrowUp},
        {"DOWN", keys::ArrowDown},
        {"LEFT", keys::ArrowLeft},
        {"RIGHT", keys::ArrowRight},
        {"ARROWUP", keys::ArrowUp},
        {"ARROWDOWN", keys::ArrowDown},
        {"ARROWLEFT", keys::ArrowLeft},
        {"ARROWRIGHT", keys::ArrowRight},

        {"F1", keys::F1}, {"F2", keys::F2}, {"F3", keys::F3}, {"F4", keys::F4},
        {"F5", keys::F5}, {"F6", keys::F6}, {"F7", keys::F7}, {"F8", keys::F8},
        {"F9", keys::F9}, {"F10", keys::F10}, {"F11", keys::F11}, {"F12", keys::F12},
    };
    return key_map;
}

} // namespace

std::string keyName(Key key) {
    switch (key) {
        case keys::Backspace: return "Backspace";
        case keys::Tab: return "Tab";
        case keys::BackTab: return "BackTab";
        case keys::Enter: return "Enter";
        case keys::Esc: return "Esc";
        case keys::Space: return "Space";
        case keys::Delete: return "Delete";
        case keys::Insert: return "Insert";
        case keys::Home: return "Home";
        case keys::End: return "End";
        case keys::PageUp: return "PageUp";
        case keys::PageDown: return "PageDown";
        case keys::ArrowUp: return "ArrowUp";
        case keys::ArrowDown: return "ArrowDown";
        case keys::ArrowLeft: return "ArrowLeft";
        case keys::ArrowRight: return "ArrowRight";
        default: break;
    }

    if (key <= keys::F1 && key >= keys::F12) {
        return "F" + std::to_string(-key);
    }
    if (key > 32 && key < 127) {
        return std::string(1, static_cast<char>(key));
    }
    return "Key(" + std::to_string(key) + ")";
}

std::optional<Key> keyFromString(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    // Single characters are case sensitive: 'a' and 'A' are different keys
    if (name.length() == 1) {
        unsigned char c = static_cast<unsigned char>(name[0]);
        if (std::isprint(c)) {
            return static_cast<Key>(c);
        }
        return std::nullopt;
    }

    std::string name_upper = name;
    std::transform(name_upper.begin(), name_upper.end(), name_upper.begin(), ::toupper);

    const auto& key_map = namedKeys();
    auto it = key_map.find(name_upper);
    if (it != key_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string Color::toString() const {
    switch (kind_) {
        case Kind::Default: return "ColorDefault";
        case Kind::Indexed: return "ColorNumber(" + std::to_string(value_) + ")";
        case Kind::Rgb: {
            return "ColorRGB(" + std::to_string((value_ >> 16) & 0xFF) + "," +
                   std::to_string((value_ >> 8) & 0xFF) + "," +
                   std::to_string(value_ & 0xFF) + ")";
        }
        default: return "ColorUnknown";
    }
}

std::string horizontalAlignToString(HorizontalAlign align) {
    switch (align) {
        case HorizontalAlign::Left: return "left";
        case HorizontalAlign::Center: return "center";
        case HorizontalAlign::Right: return "right";
        default: return "unknown";
    }
}

std::string verticalAlignToString(VerticalAlign align) {
    switch (align) {
        case VerticalAlign::Top: return "top";
        case VerticalAlign::Middle: return "middle";
        case VerticalAlign::Bottom: return "bottom";
        default: return "unknown";
    }
}

std::string lineStyleToString(LineStyle style) {
    switch (style) {
        case LineStyle::None: return "none";
        case LineStyle::Light: return "light";
        case LineStyle::Double: return "double";
        case LineStyle::Round: return "round";
        default: return "unknown";
    }
}

} // namespace tdash
