#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/Renderer.hpp>
#include <renderweave/display/Transform.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RW::Display {

using NodeId = std::uint64_t;

class Node;
using NodePtr = std::shared_ptr<Node>;

// What changed about a drawable since the painter last saw it.
namespace DirtyFlags {

inline constexpr std::uint32_t None      = 0x0000'0000u;
inline constexpr std::uint32_t Created   = 0x0000'0001u;
inline constexpr std::uint32_t Paint     = 0x0000'0002u;
inline constexpr std::uint32_t Bounds    = 0x0000'0004u;
inline constexpr std::uint32_t Transform = 0x0000'0008u;
inline constexpr std::uint32_t Relinked  = 0x0000'0010u;

} // namespace DirtyFlags

// Receives change notifications from nodes. A display registers itself once
// per node it has instantiated.
class NodeListener {
public:
    virtual ~NodeListener() = default;

    virtual void on_children_changed(Node& node) = 0;
    virtual void on_transform_changed(Node& node) = 0;
    virtual void on_paint_invalidated(Node& node, std::uint32_t dirty_flags) = 0;
    // Paintability, renderer capabilities, preferred renderer or block group changed.
    virtual void on_renderer_state_changed(Node& node) = 0;
};

// Abstract scene node. Children are shared, so the same node may appear at
// several positions of a scene; each position is mirrored by its own Instance.
class Node : public std::enable_shared_from_this<Node> {
public:
    explicit Node(std::string name = {});
    virtual ~Node();

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    [[nodiscard]] static auto create(std::string name = {}) -> NodePtr;

    [[nodiscard]] auto id() const -> NodeId { return id_; }
    [[nodiscard]] auto name() const -> std::string const& { return name_; }

    auto add_child(NodePtr child) -> Expected<void>;
    auto insert_child(std::size_t index, NodePtr child) -> Expected<void>;
    auto remove_child(Node const& child) -> Expected<void>;
    auto remove_child_at(std::size_t index) -> Expected<void>;
    auto move_child(std::size_t from, std::size_t to) -> Expected<void>;
    auto set_children(std::vector<NodePtr> children) -> Expected<void>;

    [[nodiscard]] auto children() const -> std::vector<NodePtr> const& { return children_; }
    [[nodiscard]] auto child_count() const -> std::size_t { return children_.size(); }
    [[nodiscard]] auto index_of(Node const& child) const -> std::optional<std::size_t>;

    auto set_painted(bool painted) -> void;
    [[nodiscard]] virtual auto is_painted() const -> bool { return painted_; }

    auto set_supported_renderers(std::uint32_t mask) -> void;
    [[nodiscard]] virtual auto supported_renderer_capabilities() const -> std::uint32_t {
        return supported_renderers_;
    }

    auto set_preferred_renderer(std::optional<RendererKind> kind) -> void;
    [[nodiscard]] auto preferred_renderer() const -> std::optional<RendererKind> {
        return preferred_renderer_;
    }

    // Drawables with different block groups never share a block.
    auto set_block_group(std::uint32_t group) -> void;
    [[nodiscard]] auto block_group() const -> std::uint32_t { return block_group_; }

    auto set_transform(Transform const& transform) -> void;
    [[nodiscard]] auto transform() const -> Transform const& { return transform_; }

    auto mark_paint_dirty(std::uint32_t flags = DirtyFlags::Paint) -> void;

    // Called when a drawable is created for this node; the returned handle is
    // handed to the painter with every notification about that drawable.
    virtual auto create_drawable_for(RendererKind kind) -> std::uint64_t;

    // Called when none of this node's renderers can be honored.
    virtual auto on_capability_failure(Error const& error) -> void;
    [[nodiscard]] auto last_capability_failure() const -> std::optional<Error> const& {
        return capability_failure_;
    }

    auto add_listener(NodeListener* listener) -> void;
    auto remove_listener(NodeListener* listener) -> void;
    [[nodiscard]] auto listener_count() const -> std::size_t { return listeners_.size(); }

private:
    auto validate_new_child(NodePtr const& child) const -> Expected<void>;
    auto notify_children_changed() -> void;
    auto notify_renderer_state_changed() -> void;

    NodeId                      id_;
    std::string                 name_;
    std::vector<NodePtr>        children_;
    std::vector<NodeListener*>  listeners_;
    bool                        painted_ = false;
    std::uint32_t               supported_renderers_ = Renderer::All;
    std::optional<RendererKind> preferred_renderer_;
    std::uint32_t               block_group_ = 0;
    Transform                   transform_{};
    std::optional<Error>        capability_failure_;
};

} // namespace RW::Display
