#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/ChangeInterval.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/InstanceTree.hpp>
#include <renderweave/display/Node.hpp>
#include <renderweave/display/RendererPolicy.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace RW::Display {

struct SyncResult {
    std::vector<DrawableId> created;
    std::vector<DrawableId> removed;
    std::size_t             intervals_recorded = 0;
    std::size_t             instances_created = 0;
    std::size_t             instances_released = 0;
    std::size_t             capability_failures = 0;
    // Set when an interval could not be placed in the committed list; the
    // stitch must then cover the whole list.
    std::optional<Error>    consistency_error;
};

// Brings the instance tree in line with the node tree and records one change
// interval per structural edit. Node graphs are validated before anything is
// mutated, so a failed sync leaves the tree and drawable list untouched.
class TreeSynchronizer {
public:
    TreeSynchronizer(InstanceTree& tree, DrawableStore& store, ChangeIntervalList& intervals,
                     RendererPolicy const& policy, NodeListener& listener);

    auto set_enabled_renderers(std::uint32_t mask) -> void { enabled_renderers_ = mask; }
    [[nodiscard]] auto enabled_renderers() const -> std::uint32_t { return enabled_renderers_; }

    // Requests that the next sync replace the whole tree with one rooted at `root`.
    auto replace_root(NodePtr root) -> void;
    [[nodiscard]] auto root_node() const -> NodePtr const& { return root_node_; }
    [[nodiscard]] auto has_pending_changes() const -> bool;

    auto sync() -> Expected<SyncResult>;

    // Releases every instance and drawable without recording intervals.
    auto reset() -> void;

private:
    struct ChildSlot {
        NodePtr    node;
        InstanceId reused = kNoInstance;
    };
    struct StructurePlan {
        InstanceId              parent = kNoInstance;
        std::size_t             first_changed = 0;
        std::size_t             old_end = 0;
        std::vector<ChildSlot>  middle;
        std::vector<InstanceId> removed;
    };

    auto validate_new_subtrees(InstanceId parent, std::vector<ChildSlot> const& middle) const -> Expected<void>;
    auto plan_structure(InstanceId parent) const -> std::optional<StructurePlan>;
    auto plan_renderer(InstanceId id, SyncResult& result) -> bool;
    auto record_interval(DrawableId before, DrawableId after, OrderKey start, OrderKey end, SyncResult& result)
        -> void;

    auto apply_structure(StructurePlan const& plan, SyncResult& result) -> void;
    auto apply_renderer(InstanceId id, SyncResult& result) -> void;
    auto acquire_instance(NodePtr const& node, InstanceId parent, std::uint32_t index, SyncResult& result)
        -> InstanceId;
    auto build_subtree(NodePtr const& node, InstanceId parent, std::uint32_t index, SyncResult& result)
        -> InstanceId;
    auto release_subtree(InstanceId id, SyncResult& result) -> void;
    auto assign_drawable(InstanceId id, SyncResult& result) -> void;

    InstanceTree&         tree_;
    DrawableStore&        store_;
    ChangeIntervalList&   intervals_;
    RendererPolicy const& policy_;
    NodeListener&         listener_;
    std::uint32_t         enabled_renderers_ = Renderer::All;
    NodePtr               root_node_;
    bool                  root_replaced_ = false;
};

} // namespace RW::Display
