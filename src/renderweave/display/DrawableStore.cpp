#include <renderweave/display/DrawableStore.hpp>

#include <algorithm>

namespace RW::Display {

auto DrawableStore::ensure_slot() -> DrawableId {
    if (!free_list_.empty()) {
        auto const id = free_list_.back();
        free_list_.pop_back();
        return id;
    }
    auto const id = static_cast<DrawableId>(records_.size());
    records_.push_back(DrawableRecord{});
    return id;
}

auto DrawableStore::acquire(InstanceId instance, RendererKind renderer, std::uint32_t group,
                            std::uint64_t payload_handle) -> DrawableId {
    auto const id = ensure_slot();
    auto& record = records_[id];
    record = DrawableRecord{};
    record.renderer = renderer;
    record.capabilities = Renderer::bit(renderer);
    record.group = group;
    record.instance = instance;
    record.payload_handle = payload_handle;
    record.state = DrawableState::Unattached;
    record.dirty_flags = DirtyFlags::Created;
    record.in_use = true;
    dirty_.push_back(id);
    ++active_count_;
    return id;
}

auto DrawableStore::release(DrawableId id) -> void {
    if (!exists(id)) {
        return;
    }
    records_[id] = DrawableRecord{};
    free_list_.push_back(id);
    --active_count_;
}

auto DrawableStore::note_pending_removal(DrawableId id) -> void {
    if (!exists(id)) {
        return;
    }
    records_[id].pending_removal = true;
}

auto DrawableStore::dispose(DrawableId id) -> void {
    if (!exists(id)) {
        return;
    }
    auto& record = records_[id];
    if (record.state == DrawableState::Disposed) {
        return;
    }
    record.state = DrawableState::Disposed;
    record.previous = kNoDrawable;
    record.next = kNoDrawable;
    record.pending_previous = kNoDrawable;
    record.pending_next = kNoDrawable;
    disposed_.push_back(id);
}

auto DrawableStore::release_disposed() -> std::size_t {
    auto const count = disposed_.size();
    for (auto id : disposed_) {
        release(id);
    }
    disposed_.clear();
    return count;
}

auto DrawableStore::attached(DrawableId id) const -> bool {
    if (!exists(id)) {
        return false;
    }
    auto const state = records_[id].state;
    return state == DrawableState::AttachedClean || state == DrawableState::AttachedDirty;
}

auto DrawableStore::mark_dirty(DrawableId id, std::uint32_t flags) -> bool {
    if (!exists(id)) {
        return false;
    }
    auto& record = records_[id];
    if (record.state == DrawableState::Disposed) {
        return false;
    }
    if (record.dirty_flags == DirtyFlags::None) {
        dirty_.push_back(id);
    }
    record.dirty_flags |= flags;
    if (record.state == DrawableState::AttachedClean) {
        record.state = DrawableState::AttachedDirty;
        return true;
    }
    return false;
}

auto DrawableStore::mark_clean(DrawableId id) -> void {
    if (!exists(id)) {
        return;
    }
    auto& record = records_[id];
    record.dirty_flags = DirtyFlags::None;
    if (record.state == DrawableState::AttachedDirty) {
        record.state = DrawableState::AttachedClean;
    }
}

auto DrawableStore::take_dirty() -> std::vector<DrawableId> {
    std::vector<DrawableId> result;
    result.reserve(dirty_.size());
    std::vector<bool> seen(records_.size(), false);
    for (auto id : dirty_) {
        if (attached(id) && records_[id].dirty_flags != DirtyFlags::None && !seen[id]) {
            seen[id] = true;
            result.push_back(id);
        }
    }
    // Unattached drawables stay queued until their first commit.
    std::erase_if(dirty_, [this](DrawableId id) {
        return !exists(id) || records_[id].state != DrawableState::Unattached;
    });
    return result;
}

auto DrawableStore::touch(DrawableId id) -> void {
    auto& record = records_[id];
    if (record.pending_touched) {
        return;
    }
    record.pending_touched = true;
    record.pending_previous = record.previous;
    record.pending_next = record.next;
    touched_.push_back(id);
}

auto DrawableStore::link_pending(DrawableId previous, DrawableId next) -> void {
    if (previous == kNoDrawable) {
        pending_head_ = next;
        pending_head_set_ = true;
    } else {
        assert(exists(previous));
        touch(previous);
        records_[previous].pending_next = next;
    }
    if (next == kNoDrawable) {
        pending_tail_ = previous;
        pending_tail_set_ = true;
    } else {
        assert(exists(next));
        touch(next);
        records_[next].pending_previous = previous;
    }
}

auto DrawableStore::sever_pending(DrawableId id) -> void {
    if (!exists(id)) {
        return;
    }
    touch(id);
    records_[id].pending_previous = kNoDrawable;
    records_[id].pending_next = kNoDrawable;
}

auto DrawableStore::pending_next(DrawableId id) const -> DrawableId {
    auto const& record = this->record(id);
    return record.pending_touched ? record.pending_next : record.next;
}

auto DrawableStore::pending_previous(DrawableId id) const -> DrawableId {
    auto const& record = this->record(id);
    return record.pending_touched ? record.pending_previous : record.previous;
}

auto DrawableStore::pending_head() const -> DrawableId {
    return pending_head_set_ ? pending_head_ : head_;
}

auto DrawableStore::commit_pending() -> std::vector<DrawableId> {
    std::vector<DrawableId> relinked;
    relinked.reserve(touched_.size());
    for (auto id : touched_) {
        auto& record = records_[id];
        record.pending_touched = false;
        if (record.pending_removal) {
            dispose(id);
            continue;
        }
        record.previous = record.pending_previous;
        record.next = record.pending_next;
        record.pending_previous = kNoDrawable;
        record.pending_next = kNoDrawable;
        if (record.state == DrawableState::Unattached) {
            record.state = DrawableState::AttachedDirty;
        }
        relinked.push_back(id);
    }
    touched_.clear();
    if (pending_head_set_) {
        head_ = pending_head_;
    }
    if (pending_tail_set_) {
        tail_ = pending_tail_;
    }
    pending_head_ = kNoDrawable;
    pending_tail_ = kNoDrawable;
    pending_head_set_ = false;
    pending_tail_set_ = false;
    return relinked;
}

auto DrawableStore::discard_pending() -> void {
    for (auto id : touched_) {
        auto& record = records_[id];
        record.pending_touched = false;
        record.pending_previous = kNoDrawable;
        record.pending_next = kNoDrawable;
    }
    touched_.clear();
    pending_head_ = kNoDrawable;
    pending_tail_ = kNoDrawable;
    pending_head_set_ = false;
    pending_tail_set_ = false;
}

auto DrawableStore::next(DrawableId id) const -> DrawableId {
    return record(id).next;
}

auto DrawableStore::previous(DrawableId id) const -> DrawableId {
    return record(id).previous;
}

auto DrawableStore::set_block(DrawableId id, BlockId block) -> void {
    record(id).block = block;
}

auto DrawableStore::set_interval_tag(DrawableId id, std::uint32_t tag) -> void {
    record(id).interval_tag = tag;
}

auto DrawableStore::clear_interval_tags(std::vector<DrawableId> const& ids) -> void {
    for (auto id : ids) {
        if (exists(id)) {
            records_[id].interval_tag = kNoTag;
        }
    }
}

auto DrawableStore::ordered_ids() const -> std::vector<DrawableId> {
    std::vector<DrawableId> ids;
    ids.reserve(active_count_);
    for (auto id = head_; id != kNoDrawable; id = records_[id].next) {
        ids.push_back(id);
        if (ids.size() > records_.size()) {
            break; // cycle guard; audit reports it
        }
    }
    return ids;
}

auto DrawableStore::clear() -> void {
    records_.clear();
    free_list_.clear();
    disposed_.clear();
    dirty_.clear();
    touched_.clear();
    active_count_ = 0;
    head_ = kNoDrawable;
    tail_ = kNoDrawable;
    discard_pending();
}

} // namespace RW::Display
