#include "tiledash/container/Container.hpp"
#include "tiledash/container/TreeValidator.hpp"
#include "tiledash/focus/FocusTracker.hpp"
#include "tiledash/layout/LayoutResolver.hpp"
#include "tiledash/utils/Debug.hpp"
#include <iostream>

namespace tdash {

Container::Container(ConstructionKey, Container* parent, std::shared_ptr<FocusTracker> focus_tracker)
    : parent_(parent)
    , opts_(ContainerOptions::defaults(parent ? &parent->opts_ : nullptr))
    , focus_tracker_(std::move(focus_tracker)) {}

Container::~Container() = default;

// ============================================================================
// Tree operations
// ============================================================================

Result<std::unique_ptr<Container>> Container::create(const std::vector<Option>& options) {
    auto root = std::make_unique<Container>(ConstructionKey{}, nullptr, nullptr);
    root->focus_tracker_ = std::make_shared<FocusTracker>(root.get());

    Status status = root->configure(options);
    if (!status) {
        std::cerr << "Container: Failed to apply options: " << status.error().toString() << std::endl;
        return status.error();
    }

    status = root->validate();
    if (!status) {
        std::cerr << "Container: Invalid container tree: " << status.error().toString() << std::endl;
        return status.error();
    }

    if (debugEnabled()) {
        std::cerr << "[DEBUG] Created container tree:\n" << root->describe();
    }
    return Result<std::unique_ptr<Container>>(std::move(root));
}

Status Container::configure(const std::vector<Option>& options) {
    return applyOptions(*this, options);
}

Status Container::update(const std::string& target_id, const std::vector<Option>& options) {
    if (target_id.empty()) {
        return configurationError("the container ID cannot be an empty string");
    }

    // Clearing or re-splitting an ancestor destroys this container, so
    // nothing below may touch members or the caller's id reference
    const std::string id = target_id;
    Container* tree_root = root();

    Container* target = tree_root->findById(id);
    if (!target) {
        Error error = configurationError("no container with ID \"" + id + "\"");
        std::cerr << "Container: Update failed: " << error.toString() << std::endl;
        return error;
    }

    Status status = target->configure(options);
    if (!status) {
        std::cerr << "Container: Update of \"" << id << "\" failed: "
                  << status.error().toString() << std::endl;
        return status;
    }

    status = validateTree(*tree_root);
    if (!status) {
        std::cerr << "Container: Invalid container tree after update of \"" << id << "\": "
                  << status.error().toString() << std::endl;
        return status;
    }

    if (debugEnabled()) {
        std::cerr << "[DEBUG] Updated container \"" << id << "\" with "
                  << options.size() << " option(s)" << std::endl;
    }
    return Status::ok();
}

Status Container::validate() const {
    return validateTree(*root());
}

Status Container::resolve(const Rect& area) {
    LayoutResolver resolver;
    Status status = resolver.resolve(*this, area);
    if (!status) {
        std::cerr << "Container: Layout failed for " << area << ": "
                  << status.error().toString() << std::endl;
    }
    return status;
}

// ============================================================================
// Structure
// ============================================================================

Container* Container::root() {
    Container* node = this;
    while (node->parent_) {
        node = node->parent_;
    }
    return node;
}

const Container* Container::root() const {
    const Container* node = this;
    while (node->parent_) {
        node = node->parent_;
    }
    return node;
}

Container* Container::findById(const std::string& id) {
    if (id.empty()) {
        return nullptr;
    }

    Container* found = nullptr;
    visitPreOrder([&](Container& node) {
        if (!found && node.id() == id) {
            found = &node;
        }
    });
    return found;
}

const Container* Container::findById(const std::string& id) const {
    return const_cast<Container*>(this)->findById(id);
}

bool Container::isFocused() const {
    return focus_tracker_->isActive(this);
}

std::unique_ptr<Container> Container::createChild() {
    return std::make_unique<Container>(ConstructionKey{}, this, focus_tracker_);
}

Status Container::split(const option_data::Split& split) {
    widget_.reset();
    dropChildren();

    // Sizing from an earlier split does not carry over
    opts_.split = split.axis;
    opts_.split_reversed = ContainerOptions::DEFAULT_SPLIT_REVERSED;
    opts_.split_percent.reset();
    opts_.split_fixed.reset();

    first_ = createChild();
    second_ = createChild();

    for (const auto& sizing : split.sizing) {
        Status status = sizing.apply(opts_);
        if (!status) {
            return status;
        }
    }

    if (debugEnabled()) {
        std::cerr << "[DEBUG] Split container \"" << opts_.id << "\" "
                  << splitAxisToString(split.axis) << std::endl;
    }

    Status status = applyOptions(*first_, split.first);
    if (!status) {
        return status;
    }
    return applyOptions(*second_, split.second);
}

void Container::placeWidget(std::shared_ptr<Widget> widget) {
    dropChildren();
    widget_ = std::move(widget);
}

void Container::clear() {
    dropChildren();
    widget_.reset();
}

void Container::dropChildren() {
    if (isLeaf()) {
        return;
    }

    // Focus inside a dropped child moves here
    for (const Container* p = focus_tracker_->active(); p; p = p->parent_) {
        if (p == this) {
            if (focus_tracker_->active() != this) {
                focus_tracker_->setActive(this);
            }
            break;
        }
    }

    first_.reset();
    second_.reset();
}

void Container::clearGeometry() {
    area_.reset();
    usable_area_.reset();
    widget_area_.reset();
}

// ============================================================================
// Debugging
// ============================================================================

std::string Container::describe() const {
    std::string out;
    describeInto(out, 0);
    return out;
}

void Container::describeInto(std::string& out, int depth) const {
    out.append(static_cast<size_t>(depth) * 2, ' ');
    out += opts_.id.empty() ? "<container>" : "\"" + opts_.id + "\"";

    if (!isLeaf()) {
        out += " split=" + splitAxisToString(opts_.split);
        if (opts_.split_fixed) {
            out += " fixed=" + std::to_string(*opts_.split_fixed);
        } else {
            out += " percent=" + std::to_string(opts_.effectiveSplitPercent());
        }
        if (opts_.split_reversed) {
            out += " from-end";
        }
    } else if (hasWidget()) {
        out += " widget";
    }

    if (opts_.hasBorder()) {
        out += " border=" + lineStyleToString(opts_.border);
    }
    if (area_) {
        out += " area=" + rectToString(*area_);
    }
    if (isFocused()) {
        out += " [focused]";
    }
    out += "\n";

    if (first_) first_->describeInto(out, depth + 1);
    if (second_) second_->describeInto(out, depth + 1);
}

} // namespace tdash
