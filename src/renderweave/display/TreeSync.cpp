#include <renderweave/display/TreeSync.hpp>

#include <renderweave/log/TaggedLogger.hpp>

#include <parallel_hashmap/phmap.h>

#include <algorithm>

namespace RW::Display {

namespace {

using NodeSet = phmap::flat_hash_set<Node const*>;

// Depth-first walk of the node graph below `start`. Reaching a node that is
// already on the path (or one of `ancestors`) means the graph has a cycle.
auto check_acyclic(Node const& start, NodeSet const& ancestors) -> Expected<void> {
    struct Frame {
        Node const* node;
        std::size_t next_child;
    };
    NodeSet            on_path = ancestors;
    NodeSet            done;
    std::vector<Frame> stack;

    auto cycle_error = [](Node const& node) {
        return std::unexpected(make_error("node '" + node.name() + "' would become its own ancestor",
                                          Error::Code::ContractViolation));
    };

    if (on_path.contains(&start)) {
        return cycle_error(start);
    }
    on_path.insert(&start);
    stack.push_back(Frame{&start, 0});
    while (!stack.empty()) {
        auto& frame = stack.back();
        auto const& children = frame.node->children();
        if (frame.next_child == children.size()) {
            on_path.erase(frame.node);
            done.insert(frame.node);
            stack.pop_back();
            continue;
        }
        Node const* child = children[frame.next_child++].get();
        if (done.contains(child)) {
            continue;
        }
        if (on_path.contains(child)) {
            return cycle_error(*child);
        }
        on_path.insert(child);
        stack.push_back(Frame{child, 0});
    }
    return {};
}

auto extend(OrderKey key, std::size_t index) -> OrderKey {
    key.push_back(static_cast<std::uint32_t>(index));
    return key;
}

} // namespace

TreeSynchronizer::TreeSynchronizer(InstanceTree& tree, DrawableStore& store, ChangeIntervalList& intervals,
                                   RendererPolicy const& policy, NodeListener& listener)
    : tree_(tree), store_(store), intervals_(intervals), policy_(policy), listener_(listener) {}

auto TreeSynchronizer::replace_root(NodePtr root) -> void {
    root_node_ = std::move(root);
    root_replaced_ = true;
}

auto TreeSynchronizer::has_pending_changes() const -> bool {
    return root_replaced_ || tree_.has_pending_changes();
}

auto TreeSynchronizer::sync() -> Expected<SyncResult> {
    SyncResult result;

    if (root_replaced_) {
        if (root_node_) {
            if (auto status = check_acyclic(*root_node_, {}); !status) {
                return std::unexpected(status.error());
            }
        }
        record_interval(kNoDrawable, kNoDrawable, OrderKey{}, OrderKey{kNoTag}, result);
        if (tree_.root() != kNoInstance) {
            release_subtree(tree_.root(), result);
        }
        tree_.clear_dirty_marks();
        if (root_node_) {
            tree_.set_root(build_subtree(root_node_, kNoInstance, 0, result));
        }
        root_replaced_ = false;
        rw_log("Replaced root: " + std::to_string(result.instances_created) + " instances created, "
                   + std::to_string(result.instances_released) + " released",
               "Sync");
        return result;
    }

    auto dirty = tree_.structure_dirty();
    std::stable_sort(dirty.begin(), dirty.end(), [this](InstanceId lhs, InstanceId rhs) {
        return tree_.record(lhs).depth < tree_.record(rhs).depth;
    });

    std::vector<StructurePlan> plans;
    plans.reserve(dirty.size());
    for (auto parent : dirty) {
        auto plan = plan_structure(parent);
        if (!plan) {
            continue;
        }
        if (auto status = validate_new_subtrees(parent, plan->middle); !status) {
            rw_log("Rejected sync: " + describeError(status.error()), "Sync", "Error");
            return std::unexpected(status.error());
        }
        plans.push_back(std::move(*plan));
    }

    // Nothing has been mutated yet; from here on the sync always completes.
    for (auto const& plan : plans) {
        auto const trail = tree_.trail(plan.parent);
        record_interval(tree_.drawable_before_child(plan.parent, plan.first_changed),
                        tree_.drawable_from_child(plan.parent, plan.old_end),
                        extend(trail, plan.first_changed),
                        extend(trail, plan.old_end),
                        result);
    }
    std::vector<InstanceId> renderer_changes;
    for (auto id : tree_.renderer_dirty()) {
        if (plan_renderer(id, result)) {
            renderer_changes.push_back(id);
        }
    }
    tree_.clear_dirty_marks();

    for (auto const& plan : plans) {
        if (tree_.exists(plan.parent)) {
            apply_structure(plan, result);
        }
    }
    for (auto id : renderer_changes) {
        if (tree_.exists(id)) {
            apply_renderer(id, result);
        }
    }

    if (result.intervals_recorded > 0) {
        rw_log(std::to_string(result.intervals_recorded) + " intervals, " + std::to_string(result.created.size())
                   + " drawables created, " + std::to_string(result.removed.size()) + " removed",
               "Sync");
    }
    return result;
}

auto TreeSynchronizer::plan_structure(InstanceId parent) const -> std::optional<StructurePlan> {
    auto const& record = tree_.record(parent);
    auto const& old_children = record.children;
    auto const& new_nodes = record.node->children();
    auto const old_count = old_children.size();
    auto const new_count = new_nodes.size();

    auto node_at = [this, &old_children](std::size_t index) {
        return tree_.record(old_children[index]).node.get();
    };

    std::size_t prefix = 0;
    while (prefix < old_count && prefix < new_count && node_at(prefix) == new_nodes[prefix].get()) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < old_count - prefix && suffix < new_count - prefix
           && node_at(old_count - 1 - suffix) == new_nodes[new_count - 1 - suffix].get()) {
        ++suffix;
    }
    if (prefix + suffix == old_count && prefix + suffix == new_count) {
        return std::nullopt;
    }

    StructurePlan plan;
    plan.parent = parent;
    plan.first_changed = prefix;
    plan.old_end = old_count - suffix;

    phmap::flat_hash_map<Node const*, InstanceId> old_middle;
    for (auto i = prefix; i < plan.old_end; ++i) {
        old_middle.emplace(node_at(i), old_children[i]);
    }
    for (auto j = prefix; j < new_count - suffix; ++j) {
        ChildSlot slot{new_nodes[j], kNoInstance};
        if (auto it = old_middle.find(new_nodes[j].get()); it != old_middle.end()) {
            slot.reused = it->second;
            old_middle.erase(it);
        }
        plan.middle.push_back(std::move(slot));
    }
    for (auto i = prefix; i < plan.old_end; ++i) {
        if (old_middle.contains(node_at(i))) {
            plan.removed.push_back(old_children[i]);
        }
    }
    return plan;
}

auto TreeSynchronizer::validate_new_subtrees(InstanceId parent, std::vector<ChildSlot> const& middle) const
    -> Expected<void> {
    NodeSet ancestors;
    for (auto current = parent; current != kNoInstance; current = tree_.record(current).parent) {
        ancestors.insert(tree_.record(current).node.get());
    }
    for (auto const& slot : middle) {
        if (slot.reused != kNoInstance) {
            continue;
        }
        if (auto status = check_acyclic(*slot.node, ancestors); !status) {
            return status;
        }
    }
    return {};
}

auto TreeSynchronizer::plan_renderer(InstanceId id, SyncResult& result) -> bool {
    auto& record = tree_.record(id);
    auto const& node = *record.node;
    bool const painted = node.is_painted();
    auto const kind = painted ? policy_.choose(node, enabled_renderers_) : std::nullopt;

    if (record.drawable == kNoDrawable) {
        if (!painted) {
            record.degraded = false;
            return false;
        }
        if (!kind) {
            // Stays without a drawable; apply reports the failure again.
            return true;
        }
    } else if (kind) {
        auto const& drawable = store_.record(record.drawable);
        if (drawable.renderer == *kind && drawable.group == node.block_group()) {
            return false;
        }
    }

    auto const trail = tree_.trail(id);
    record_interval(tree_.drawable_before(id), tree_.drawable_from_child(id, 0), trail, extend(trail, 0), result);
    return true;
}

auto TreeSynchronizer::record_interval(DrawableId before, DrawableId after, OrderKey start, OrderKey end,
                                       SyncResult& result) -> void {
    auto recorded = intervals_.record(store_, before, after, std::move(start), std::move(end));
    if (!recorded) {
        rw_log("Interval not recorded: " + describeError(recorded.error()), "Consistency");
        if (!result.consistency_error) {
            result.consistency_error = recorded.error();
        }
        return;
    }
    ++result.intervals_recorded;
}

auto TreeSynchronizer::apply_structure(StructurePlan const& plan, SyncResult& result) -> void {
    auto const old_children = tree_.record(plan.parent).children;
    for (auto removed : plan.removed) {
        release_subtree(removed, result);
    }

    std::vector<InstanceId> children(old_children.begin(),
                                     old_children.begin() + static_cast<std::ptrdiff_t>(plan.first_changed));
    children.reserve(old_children.size() + plan.middle.size());
    for (auto const& slot : plan.middle) {
        if (slot.reused != kNoInstance) {
            children.push_back(slot.reused);
        } else {
            children.push_back(
                build_subtree(slot.node, plan.parent, static_cast<std::uint32_t>(children.size()), result));
        }
    }
    children.insert(children.end(), old_children.begin() + static_cast<std::ptrdiff_t>(plan.old_end),
                    old_children.end());
    tree_.set_children(plan.parent, std::move(children));
}

auto TreeSynchronizer::apply_renderer(InstanceId id, SyncResult& result) -> void {
    auto const old = tree_.record(id).drawable;
    if (old != kNoDrawable) {
        store_.note_pending_removal(old);
        result.removed.push_back(old);
        tree_.set_drawable(id, kNoDrawable);
    }
    assign_drawable(id, result);
}

auto TreeSynchronizer::acquire_instance(NodePtr const& node, InstanceId parent, std::uint32_t index,
                                        SyncResult& result) -> InstanceId {
    if (!tree_.has_instances(*node)) {
        node->add_listener(&listener_);
    }
    ++result.instances_created;
    return tree_.acquire(node, parent, index);
}

auto TreeSynchronizer::build_subtree(NodePtr const& node, InstanceId parent, std::uint32_t index,
                                     SyncResult& result) -> InstanceId {
    auto const top = acquire_instance(node, parent, index, result);
    std::vector<InstanceId> pending{top};
    while (!pending.empty()) {
        auto const id = pending.back();
        pending.pop_back();
        assign_drawable(id, result);

        auto const current = tree_.record(id).node;
        auto const& child_nodes = current->children();
        std::vector<InstanceId> children;
        children.reserve(child_nodes.size());
        for (std::size_t i = 0; i < child_nodes.size(); ++i) {
            children.push_back(acquire_instance(child_nodes[i], id, static_cast<std::uint32_t>(i), result));
        }
        pending.insert(pending.end(), children.rbegin(), children.rend());
        tree_.set_children(id, std::move(children));
    }
    return top;
}

auto TreeSynchronizer::release_subtree(InstanceId id, SyncResult& result) -> void {
    std::vector<InstanceId> pending{id};
    while (!pending.empty()) {
        auto const current = pending.back();
        pending.pop_back();
        auto const& record = tree_.record(current);
        pending.insert(pending.end(), record.children.begin(), record.children.end());

        if (auto const drawable = record.drawable; drawable != kNoDrawable) {
            if (store_.attached(drawable)) {
                store_.note_pending_removal(drawable);
                result.removed.push_back(drawable);
            } else {
                store_.dispose(drawable);
            }
        }
        auto const node = record.node;
        tree_.release(current);
        ++result.instances_released;
        if (!tree_.has_instances(*node)) {
            node->remove_listener(&listener_);
        }
    }
}

auto TreeSynchronizer::assign_drawable(InstanceId id, SyncResult& result) -> void {
    auto const node = tree_.record(id).node;
    tree_.record(id).degraded = false;
    if (!node->is_painted()) {
        return;
    }
    auto const kind = policy_.choose(*node, enabled_renderers_);
    if (!kind) {
        tree_.record(id).degraded = true;
        ++result.capability_failures;
        rw_log("Node '" + node->name() + "' has no usable renderer", "Capability");
        node->on_capability_failure(make_error("node '" + node->name() + "' supports none of the enabled renderers",
                                               Error::Code::CapabilityMismatch));
        return;
    }
    auto const payload = node->create_drawable_for(*kind);
    auto const drawable = store_.acquire(id, *kind, node->block_group(), payload);
    store_.record(drawable).capabilities = node->supported_renderer_capabilities() & enabled_renderers_;
    tree_.set_drawable(id, drawable);
    result.created.push_back(drawable);
}

auto TreeSynchronizer::reset() -> void {
    if (tree_.root() != kNoInstance) {
        std::vector<InstanceId> pending{tree_.root()};
        while (!pending.empty()) {
            auto const current = pending.back();
            pending.pop_back();
            auto const& record = tree_.record(current);
            pending.insert(pending.end(), record.children.begin(), record.children.end());
            record.node->remove_listener(&listener_);
        }
    }
    tree_.clear();
    store_.clear();
    intervals_ = ChangeIntervalList{};
    root_replaced_ = root_node_ != nullptr;
}

} // namespace RW::Display
