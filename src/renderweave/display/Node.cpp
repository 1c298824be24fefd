#include <renderweave/display/Node.hpp>

#include <algorithm>
#include <atomic>

namespace RW::Display {

namespace {

auto next_node_id() -> NodeId {
    static std::atomic<NodeId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

Node::Node(std::string name)
    : id_(next_node_id()), name_(std::move(name)) {}

Node::~Node() = default;

auto Node::create(std::string name) -> NodePtr {
    return std::make_shared<Node>(std::move(name));
}

auto Node::validate_new_child(NodePtr const& child) const -> Expected<void> {
    if (!child) {
        return std::unexpected(make_error("child node is null", Error::Code::InvalidArgument));
    }
    if (child.get() == this) {
        return std::unexpected(make_error("node cannot be its own child", Error::Code::InvalidArgument));
    }
    for (auto const& existing : children_) {
        if (existing.get() == child.get()) {
            return std::unexpected(make_error("node '" + child->name() + "' is already a child of '" + name_ + "'",
                                              Error::Code::InvalidArgument));
        }
    }
    return {};
}

auto Node::add_child(NodePtr child) -> Expected<void> {
    return insert_child(children_.size(), std::move(child));
}

auto Node::insert_child(std::size_t index, NodePtr child) -> Expected<void> {
    if (index > children_.size()) {
        return std::unexpected(make_error("child index out of range", Error::Code::InvalidArgument));
    }
    if (auto status = validate_new_child(child); !status) {
        return status;
    }
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    notify_children_changed();
    return {};
}

auto Node::remove_child(Node const& child) -> Expected<void> {
    auto const index = index_of(child);
    if (!index) {
        return std::unexpected(make_error("node '" + child.name() + "' is not a child of '" + name_ + "'",
                                          Error::Code::InvalidArgument));
    }
    return remove_child_at(*index);
}

auto Node::remove_child_at(std::size_t index) -> Expected<void> {
    if (index >= children_.size()) {
        return std::unexpected(make_error("child index out of range", Error::Code::InvalidArgument));
    }
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
    notify_children_changed();
    return {};
}

auto Node::move_child(std::size_t from, std::size_t to) -> Expected<void> {
    if (from >= children_.size() || to >= children_.size()) {
        return std::unexpected(make_error("child index out of range", Error::Code::InvalidArgument));
    }
    if (from == to) {
        return {};
    }
    auto moved = std::move(children_[from]);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(from));
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    notify_children_changed();
    return {};
}

auto Node::set_children(std::vector<NodePtr> children) -> Expected<void> {
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (!children[i] || children[i].get() == this) {
            return std::unexpected(make_error("invalid child at index " + std::to_string(i),
                                              Error::Code::InvalidArgument));
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (children[j].get() == children[i].get()) {
                return std::unexpected(make_error("duplicate child at index " + std::to_string(i),
                                                  Error::Code::InvalidArgument));
            }
        }
    }
    children_ = std::move(children);
    notify_children_changed();
    return {};
}

auto Node::index_of(Node const& child) const -> std::optional<std::size_t> {
    auto const it = std::find_if(children_.begin(), children_.end(), [&](NodePtr const& candidate) {
        return candidate.get() == &child;
    });
    if (it == children_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - children_.begin());
}

auto Node::set_painted(bool painted) -> void {
    if (painted_ == painted) {
        return;
    }
    painted_ = painted;
    notify_renderer_state_changed();
}

auto Node::set_supported_renderers(std::uint32_t mask) -> void {
    if (supported_renderers_ == mask) {
        return;
    }
    supported_renderers_ = mask;
    capability_failure_.reset();
    notify_renderer_state_changed();
}

auto Node::set_preferred_renderer(std::optional<RendererKind> kind) -> void {
    if (preferred_renderer_ == kind) {
        return;
    }
    preferred_renderer_ = kind;
    notify_renderer_state_changed();
}

auto Node::set_block_group(std::uint32_t group) -> void {
    if (block_group_ == group) {
        return;
    }
    block_group_ = group;
    notify_renderer_state_changed();
}

auto Node::set_transform(Transform const& transform) -> void {
    if (transform_ == transform) {
        return;
    }
    transform_ = transform;
    auto const listeners = listeners_;
    for (auto* listener : listeners) {
        listener->on_transform_changed(*this);
    }
}

auto Node::mark_paint_dirty(std::uint32_t flags) -> void {
    auto const listeners = listeners_;
    for (auto* listener : listeners) {
        listener->on_paint_invalidated(*this, flags);
    }
}

auto Node::create_drawable_for(RendererKind) -> std::uint64_t {
    return id_;
}

auto Node::on_capability_failure(Error const& error) -> void {
    capability_failure_ = error;
}

auto Node::add_listener(NodeListener* listener) -> void {
    if (listener == nullptr) {
        return;
    }
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

auto Node::remove_listener(NodeListener* listener) -> void {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

auto Node::notify_children_changed() -> void {
    auto const listeners = listeners_;
    for (auto* listener : listeners) {
        listener->on_children_changed(*this);
    }
}

auto Node::notify_renderer_state_changed() -> void {
    auto const listeners = listeners_;
    for (auto* listener : listeners) {
        listener->on_renderer_state_changed(*this);
    }
}

} // namespace RW::Display
