#pragma once

#include <renderweave/display/ChangeInterval.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/Node.hpp>
#include <renderweave/display/Transform.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace RW::Display {

// One node at one position of the scene.
struct InstanceRecord {
    NodePtr                 node;
    InstanceId              parent = kNoInstance;
    std::vector<InstanceId> children;
    std::uint32_t           index_in_parent = 0;
    std::uint32_t           depth = 0;
    DrawableId              drawable = kNoDrawable;
    // Painted, but no enabled renderer could draw it.
    bool                    degraded = false;

    bool structure_dirty = false;
    bool renderer_dirty = false;

    Transform     composed_transform{};
    bool          transform_dirty = true;
    // Epoch in which some descendant had its transform invalidated.
    std::uint64_t child_transform_dirty_epoch = 0;

    bool in_use = false;
};

// Arena mirroring the node tree. Released slots are parked until
// recycle_released() so ids handed out during a sync never alias.
class InstanceTree {
public:
    InstanceTree() = default;

    auto acquire(NodePtr node, InstanceId parent, std::uint32_t index_in_parent) -> InstanceId;
    auto release(InstanceId id) -> void;
    auto recycle_released() -> std::size_t;

    auto set_root(InstanceId id) -> void { root_ = id; }
    [[nodiscard]] auto root() const -> InstanceId { return root_; }

    [[nodiscard]] auto exists(InstanceId id) const -> bool {
        return id < records_.size() && records_[id].in_use;
    }
    [[nodiscard]] auto record(InstanceId id) const -> InstanceRecord const& {
        assert(exists(id));
        return records_[id];
    }
    [[nodiscard]] auto record(InstanceId id) -> InstanceRecord& {
        assert(exists(id));
        return records_[id];
    }

    // Replaces the child list and refreshes index_in_parent.
    auto set_children(InstanceId id, std::vector<InstanceId> children) -> void;
    auto set_drawable(InstanceId id, DrawableId drawable) -> void;

    // Child-index path from the root; the root's trail is empty.
    [[nodiscard]] auto trail(InstanceId id) const -> OrderKey;
    // Node ids from the root down to the instance.
    [[nodiscard]] auto node_trail(InstanceId id) const -> std::vector<NodeId>;

    [[nodiscard]] auto instances_of(Node const& node) const -> std::vector<InstanceId>;
    [[nodiscard]] auto has_instances(Node const& node) const -> bool { return by_node_.contains(&node); }

    // Pre-order successor, or kNoInstance past the last instance.
    [[nodiscard]] auto preorder_next(InstanceId id) const -> InstanceId;
    // First instance after the subtree rooted at id.
    [[nodiscard]] auto next_after_subtree(InstanceId id) const -> InstanceId;

    [[nodiscard]] auto first_drawable_in_subtree(InstanceId id) const -> DrawableId;
    [[nodiscard]] auto last_drawable_in_subtree(InstanceId id) const -> DrawableId;
    // Last drawable ordered before child slot `index` of parent: inside the
    // earlier children, then the parent itself, then anything before it.
    [[nodiscard]] auto drawable_before_child(InstanceId parent, std::size_t index) const -> DrawableId;
    // First drawable at or after child slot `index` of parent.
    [[nodiscard]] auto drawable_from_child(InstanceId parent, std::size_t index) const -> DrawableId;
    [[nodiscard]] auto drawable_before(InstanceId id) const -> DrawableId;
    [[nodiscard]] auto drawable_after_subtree(InstanceId id) const -> DrawableId;

    auto mark_structure_dirty(InstanceId id) -> void;
    auto mark_renderer_dirty(InstanceId id) -> void;
    [[nodiscard]] auto structure_dirty() const -> std::vector<InstanceId>;
    [[nodiscard]] auto renderer_dirty() const -> std::vector<InstanceId>;
    auto clear_dirty_marks() -> void;
    [[nodiscard]] auto has_pending_changes() const -> bool {
        return !structure_dirty_.empty() || !renderer_dirty_.empty();
    }

    auto mark_transform_dirty(InstanceId id) -> void;
    // Composes the transform on demand, revalidating dirty ancestors first.
    [[nodiscard]] auto composed_transform(InstanceId id) -> Transform const&;
    // Recomputes every stale composed transform, skipping clean subtrees.
    // on_changed receives the drawable of each instance whose transform moved.
    auto validate_transforms(std::function<void(DrawableId)> const& on_changed) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t { return active_count_; }
    [[nodiscard]] auto capacity() const -> std::size_t { return records_.size(); }
    auto clear() -> void;

private:
    auto ensure_slot() -> InstanceId;
    auto stamp_ancestors(InstanceId id) -> void;
    auto recompose(InstanceId id) -> bool;

    std::vector<InstanceRecord> records_{};
    std::vector<InstanceId>     free_list_{};
    std::vector<InstanceId>     released_{};
    std::vector<InstanceId>     structure_dirty_{};
    std::vector<InstanceId>     renderer_dirty_{};
    std::vector<InstanceId>     lazily_recomposed_{};
    std::size_t                 active_count_ = 0;
    InstanceId                  root_ = kNoInstance;
    std::uint64_t               transform_epoch_ = 1;

    phmap::flat_hash_map<Node const*, std::vector<InstanceId>> by_node_{};
};

} // namespace RW::Display
