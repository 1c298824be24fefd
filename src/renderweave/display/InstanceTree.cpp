#include <renderweave/display/InstanceTree.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace RW::Display {

auto InstanceTree::ensure_slot() -> InstanceId {
    if (!free_list_.empty()) {
        auto const id = free_list_.back();
        free_list_.pop_back();
        return id;
    }
    auto const id = static_cast<InstanceId>(records_.size());
    records_.push_back(InstanceRecord{});
    return id;
}

auto InstanceTree::acquire(NodePtr node, InstanceId parent, std::uint32_t index_in_parent) -> InstanceId {
    auto const id = ensure_slot();
    auto& record = records_[id];
    record = InstanceRecord{};
    record.node = std::move(node);
    record.parent = parent;
    record.index_in_parent = index_in_parent;
    record.depth = parent == kNoInstance ? 0u : records_[parent].depth + 1u;
    record.in_use = true;
    by_node_[record.node.get()].push_back(id);
    ++active_count_;
    stamp_ancestors(id);
    return id;
}

auto InstanceTree::release(InstanceId id) -> void {
    if (!exists(id)) {
        return;
    }
    auto& record = records_[id];
    if (auto it = by_node_.find(record.node.get()); it != by_node_.end()) {
        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) {
            by_node_.erase(it);
        }
    }
    if (root_ == id) {
        root_ = kNoInstance;
    }
    record = InstanceRecord{};
    released_.push_back(id);
    --active_count_;
}

auto InstanceTree::recycle_released() -> std::size_t {
    auto const count = released_.size();
    free_list_.insert(free_list_.end(), released_.begin(), released_.end());
    released_.clear();
    return count;
}

auto InstanceTree::set_children(InstanceId id, std::vector<InstanceId> children) -> void {
    auto& record = this->record(id);
    record.children = std::move(children);
    for (std::size_t i = 0; i < record.children.size(); ++i) {
        records_[record.children[i]].index_in_parent = static_cast<std::uint32_t>(i);
    }
}

auto InstanceTree::set_drawable(InstanceId id, DrawableId drawable) -> void {
    record(id).drawable = drawable;
}

auto InstanceTree::trail(InstanceId id) const -> OrderKey {
    OrderKey key;
    for (auto current = id; current != kNoInstance && records_[current].parent != kNoInstance;
         current = records_[current].parent) {
        key.push_back(records_[current].index_in_parent);
    }
    std::reverse(key.begin(), key.end());
    return key;
}

auto InstanceTree::node_trail(InstanceId id) const -> std::vector<NodeId> {
    std::vector<NodeId> nodes;
    for (auto current = id; current != kNoInstance; current = records_[current].parent) {
        nodes.push_back(records_[current].node->id());
    }
    std::reverse(nodes.begin(), nodes.end());
    return nodes;
}

auto InstanceTree::instances_of(Node const& node) const -> std::vector<InstanceId> {
    if (auto it = by_node_.find(&node); it != by_node_.end()) {
        return it->second;
    }
    return {};
}

auto InstanceTree::preorder_next(InstanceId id) const -> InstanceId {
    auto const& record = this->record(id);
    if (!record.children.empty()) {
        return record.children.front();
    }
    return next_after_subtree(id);
}

auto InstanceTree::next_after_subtree(InstanceId id) const -> InstanceId {
    auto current = id;
    while (current != kNoInstance) {
        auto const& record = records_[current];
        if (record.parent == kNoInstance) {
            return kNoInstance;
        }
        auto const& siblings = records_[record.parent].children;
        if (record.index_in_parent + 1u < siblings.size()) {
            return siblings[record.index_in_parent + 1u];
        }
        current = record.parent;
    }
    return kNoInstance;
}

auto InstanceTree::first_drawable_in_subtree(InstanceId id) const -> DrawableId {
    auto const end = next_after_subtree(id);
    for (auto current = id; current != end && current != kNoInstance; current = preorder_next(current)) {
        if (records_[current].drawable != kNoDrawable) {
            return records_[current].drawable;
        }
    }
    return kNoDrawable;
}

auto InstanceTree::last_drawable_in_subtree(InstanceId id) const -> DrawableId {
    // Reverse pre-order: deepest last descendant first, then back up.
    auto deepest_last = [this](InstanceId from) {
        while (!records_[from].children.empty()) {
            from = records_[from].children.back();
        }
        return from;
    };
    auto current = deepest_last(id);
    while (true) {
        auto const& record = records_[current];
        if (record.drawable != kNoDrawable) {
            return record.drawable;
        }
        if (current == id) {
            return kNoDrawable;
        }
        if (record.index_in_parent > 0u) {
            current = deepest_last(records_[record.parent].children[record.index_in_parent - 1u]);
        } else {
            current = record.parent;
        }
    }
}

auto InstanceTree::drawable_before_child(InstanceId parent, std::size_t index) const -> DrawableId {
    auto const& record = this->record(parent);
    for (auto k = std::min(index, record.children.size()); k > 0; --k) {
        if (auto drawable = last_drawable_in_subtree(record.children[k - 1]); drawable != kNoDrawable) {
            return drawable;
        }
    }
    if (record.drawable != kNoDrawable) {
        return record.drawable;
    }
    return drawable_before(parent);
}

auto InstanceTree::drawable_from_child(InstanceId parent, std::size_t index) const -> DrawableId {
    auto const& record = this->record(parent);
    for (auto k = index; k < record.children.size(); ++k) {
        if (auto drawable = first_drawable_in_subtree(record.children[k]); drawable != kNoDrawable) {
            return drawable;
        }
    }
    return drawable_after_subtree(parent);
}

auto InstanceTree::drawable_before(InstanceId id) const -> DrawableId {
    auto const& record = this->record(id);
    if (record.parent == kNoInstance) {
        return kNoDrawable;
    }
    return drawable_before_child(record.parent, record.index_in_parent);
}

auto InstanceTree::drawable_after_subtree(InstanceId id) const -> DrawableId {
    auto const& record = this->record(id);
    if (record.parent == kNoInstance) {
        return kNoDrawable;
    }
    return drawable_from_child(record.parent, record.index_in_parent + 1u);
}

auto InstanceTree::mark_structure_dirty(InstanceId id) -> void {
    auto& record = this->record(id);
    if (!record.structure_dirty) {
        record.structure_dirty = true;
        structure_dirty_.push_back(id);
    }
}

auto InstanceTree::mark_renderer_dirty(InstanceId id) -> void {
    auto& record = this->record(id);
    if (!record.renderer_dirty) {
        record.renderer_dirty = true;
        renderer_dirty_.push_back(id);
    }
}

auto InstanceTree::structure_dirty() const -> std::vector<InstanceId> {
    std::vector<InstanceId> ids;
    for (auto id : structure_dirty_) {
        if (exists(id) && records_[id].structure_dirty) {
            ids.push_back(id);
        }
    }
    return ids;
}

auto InstanceTree::renderer_dirty() const -> std::vector<InstanceId> {
    std::vector<InstanceId> ids;
    for (auto id : renderer_dirty_) {
        if (exists(id) && records_[id].renderer_dirty) {
            ids.push_back(id);
        }
    }
    return ids;
}

auto InstanceTree::clear_dirty_marks() -> void {
    for (auto id : structure_dirty_) {
        if (exists(id)) {
            records_[id].structure_dirty = false;
        }
    }
    for (auto id : renderer_dirty_) {
        if (exists(id)) {
            records_[id].renderer_dirty = false;
        }
    }
    structure_dirty_.clear();
    renderer_dirty_.clear();
}

auto InstanceTree::stamp_ancestors(InstanceId id) -> void {
    for (auto current = records_[id].parent; current != kNoInstance; current = records_[current].parent) {
        auto& record = records_[current];
        if (record.child_transform_dirty_epoch == transform_epoch_) {
            break;
        }
        record.child_transform_dirty_epoch = transform_epoch_;
    }
}

auto InstanceTree::mark_transform_dirty(InstanceId id) -> void {
    record(id).transform_dirty = true;
    stamp_ancestors(id);
}

auto InstanceTree::recompose(InstanceId id) -> bool {
    auto& record = records_[id];
    auto const parent = record.parent == kNoInstance ? Transform::identity()
                                                     : records_[record.parent].composed_transform;
    auto const composed = parent.multiply(record.node->transform());
    record.transform_dirty = false;
    if (composed == record.composed_transform) {
        return false;
    }
    record.composed_transform = composed;
    return true;
}

auto InstanceTree::composed_transform(InstanceId id) -> Transform const& {
    std::vector<InstanceId> path;
    for (auto current = id; current != kNoInstance; current = records_[current].parent) {
        path.push_back(current);
    }
    bool stale = false;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        auto const current = *it;
        stale = stale || records_[current].transform_dirty;
        if (!stale) {
            continue;
        }
        if (recompose(current)) {
            lazily_recomposed_.push_back(current);
        }
        // Siblings off the path are now stale relative to this instance.
        auto const on_path = std::next(it) != path.rend() ? *std::next(it) : kNoInstance;
        for (auto child : records_[current].children) {
            if (child != on_path) {
                records_[child].transform_dirty = true;
                stamp_ancestors(child);
            }
        }
    }
    return records_[id].composed_transform;
}

auto InstanceTree::validate_transforms(std::function<void(DrawableId)> const& on_changed) -> std::size_t {
    std::size_t recomputed = 0;
    for (auto id : lazily_recomposed_) {
        if (exists(id) && records_[id].drawable != kNoDrawable) {
            on_changed(records_[id].drawable);
        }
    }
    lazily_recomposed_.clear();

    if (root_ != kNoInstance) {
        std::vector<std::pair<InstanceId, bool>> stack{{root_, false}};
        while (!stack.empty()) {
            auto const [id, parent_changed] = stack.back();
            stack.pop_back();
            auto const& record = records_[id];
            bool const stale = parent_changed || record.transform_dirty;
            bool changed = false;
            if (stale) {
                changed = recompose(id);
                ++recomputed;
                if (changed && record.drawable != kNoDrawable) {
                    on_changed(record.drawable);
                }
            }
            if (changed || record.child_transform_dirty_epoch == transform_epoch_) {
                for (auto it = record.children.rbegin(); it != record.children.rend(); ++it) {
                    stack.emplace_back(*it, changed);
                }
            }
        }
    }
    ++transform_epoch_;
    return recomputed;
}

auto InstanceTree::clear() -> void {
    records_.clear();
    free_list_.clear();
    released_.clear();
    structure_dirty_.clear();
    renderer_dirty_.clear();
    lazily_recomposed_.clear();
    by_node_.clear();
    active_count_ = 0;
    root_ = kNoInstance;
    transform_epoch_ = 1;
}

} // namespace RW::Display
