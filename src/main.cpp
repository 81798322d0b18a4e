#include "tiledash/container/Container.hpp"
#include "tiledash/focus/FocusTracker.hpp"
#include "tiledash/utils/Debug.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace tdash;

namespace {

// Stand-in for a real widget, the demo only needs something to place
class Placeholder : public Widget {
public:
    explicit Placeholder(std::string label) : label_(std::move(label)) {}
    const std::string& label() const { return label_; }

private:
    std::string label_;
};

void printUsage(const char* program_name) {
    std::cout << "tiledash - terminal dashboard layout demo\n"
              << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "  --width N               Terminal width in cells (default 80)\n"
              << "  --height N              Terminal height in cells (default 24)\n"
              << "  --focus-next KEY        Key moving focus forward (default Tab)\n"
              << "  --focus-previous KEY    Key moving focus backward (default BackTab)\n"
              << "  --keys KEY...           Key presses to replay after layout\n"
              << "  --debug                 Enable debug logging\n"
              << "\nKeys are single characters or names such as Tab, Enter, F1, ArrowUp.\n"
              << std::endl;
}

void printVersion() {
    std::cout << "tiledash v0.1.0\n"
              << "Built with C++20\n"
              << std::endl;
}

std::optional<int> parseDimension(const std::string& text) {
    if (text.empty()) return std::nullopt;

    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || value <= 0 || value > 10000) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::string label(const Container& c) {
    return c.id().empty() ? "<container>" : c.id();
}

std::vector<Option> dashboardLayout(Key focus_next, Key focus_previous) {
    auto menu = std::make_shared<Placeholder>("menu");
    auto chart = std::make_shared<Placeholder>("chart");
    auto gauge = std::make_shared<Placeholder>("gauge");
    auto log = std::make_shared<Placeholder>("log");

    return {
        id("root"),
        border(LineStyle::Light),
        borderTitle("tiledash"),
        keyFocusNext(focus_next),
        keyFocusPrevious(focus_previous),
        keyFocusGroupsNext('n', {1}),
        keyFocusGroupsPrevious('p', {1}),
        splitVertical(
            Left{{
                id("menu"),
                placeWidget(menu),
                border(LineStyle::Round),
                paddingLeft(1),
                keyFocusGroups({1}),
                focused(),
            }},
            Right{{
                splitHorizontal(
                    Top{{
                        splitVertical(
                            Left{{id("chart"), placeWidget(chart), marginRightPercent(5),
                                  keyFocusGroups({1})}},
                            Right{{id("gauge"), placeWidget(gauge), keyFocusSkip()}},
                            {splitPercent(70)}),
                    }},
                    Bottom{{
                        id("log"),
                        placeWidget(log),
                        border(LineStyle::Light),
                        borderTitle("log"),
                        paddingTop(1),
                        keyFocusGroups({1}),
                    }},
                    {splitPercentFromEnd(30)}),
            }},
            {splitFixed(20)}),
    };
}

void printAreas(const Container& root) {
    root.visitPreOrder([](const Container& c) {
        std::cout << "  " << std::left << std::setw(12) << label(c);
        if (c.area()) {
            std::cout << " area " << *c.area();
        } else {
            std::cout << " unresolved";
        }
        if (c.widgetArea()) {
            std::cout << "  widget " << *c.widgetArea();
        }
        std::cout << std::endl;
    });
}

} // namespace

int main(int argc, char* argv[]) {
    int width = 80;
    int height = 24;
    Key focus_next = keys::Tab;
    Key focus_previous = keys::BackTab;
    std::vector<Key> presses;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            printVersion();
            return 0;
        }

        if (arg == "--debug") {
            setDebugEnabled(true);
            continue;
        }

        if (arg == "--width" || arg == "--height") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number" << std::endl;
                return 1;
            }
            auto value = parseDimension(argv[++i]);
            if (!value) {
                std::cerr << "Error: invalid " << arg << " value: " << argv[i] << std::endl;
                return 1;
            }
            (arg == "--width" ? width : height) = *value;
            continue;
        }

        if (arg == "--focus-next" || arg == "--focus-previous") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a key" << std::endl;
                return 1;
            }
            auto key = keyFromString(argv[++i]);
            if (!key) {
                std::cerr << "Error: unknown key: " << argv[i] << std::endl;
                return 1;
            }
            (arg == "--focus-next" ? focus_next : focus_previous) = *key;
            continue;
        }

        if (arg == "--keys") {
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                auto key = keyFromString(argv[++i]);
                if (!key) {
                    std::cerr << "Error: unknown key: " << argv[i] << std::endl;
                    return 1;
                }
                presses.push_back(*key);
            }
            continue;
        }

        std::cerr << "Error: unknown option: " << arg << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    auto created = Container::create(dashboardLayout(focus_next, focus_previous));
    if (!created) {
        return 1;
    }
    std::unique_ptr<Container> root = std::move(created).value();

    std::cout << "Container tree:\n" << root->describe() << std::endl;

    Rect terminal{0, 0, width, height};
    Status status = root->resolve(terminal);
    std::cout << "Layout for " << terminal << (status ? "" : " (partial)") << ":" << std::endl;
    printAreas(*root);

    FocusTracker& focus = root->focusTracker();
    std::cout << "\nFocused: " << label(*focus.active()) << std::endl;
    for (Key key : presses) {
        bool handled = focus.processKey(key);
        std::cout << "  " << std::left << std::setw(10) << keyName(key)
                  << (handled ? "-> " : "(ignored) ")
                  << label(*focus.active()) << std::endl;
    }

    return status ? 0 : 1;
}
