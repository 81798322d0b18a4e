#include "tiledash/container/TreeValidator.hpp"
#include "tiledash/container/Container.hpp"
#include "tiledash/utils/Debug.hpp"
#include <iostream>
#include <unordered_set>
#include <vector>

namespace tdash {

namespace {

void checkSplitSizing(const Container& node, std::vector<Error>& problems) {
    // Fixed sizing alongside the default percentage is allowed
    const ContainerOptions& opts = node.options();
    if (opts.split_fixed &&
        opts.effectiveSplitPercent() != ContainerOptions::DEFAULT_SPLIT_PERCENT) {
        problems.push_back(configurationError(
            "only one of splitFixed(" + std::to_string(*opts.split_fixed) +
            ") and splitPercent(" + std::to_string(opts.effectiveSplitPercent()) + ") is allowed",
            opts.id));
    }
}

} // namespace

Status validateTree(const Container& root) {
    std::unordered_set<std::string> seen_ids;
    std::vector<Error> problems;

    root.visitPreOrder([&](const Container& node) {
        const std::string& id = node.id();
        if (!id.empty() && !seen_ids.insert(id).second) {
            problems.push_back(configurationError("duplicate container ID \"" + id + "\"", id));
        }
        checkSplitSizing(node, problems);
    });

    if (problems.empty()) {
        return Status::ok();
    }

    if (debugEnabled()) {
        std::cerr << "[DEBUG] Tree validation found " << problems.size() << " problem(s)" << std::endl;
    }

    if (problems.size() == 1) {
        return problems.front();
    }

    std::string message;
    for (const auto& problem : problems) {
        if (!message.empty()) message += "; ";
        message += problem.message;
        if (!problem.container_id.empty()) {
            message += " (in \"" + problem.container_id + "\")";
        }
    }
    return configurationError(message);
}

} // namespace tdash
