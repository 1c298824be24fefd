#include <renderweave/display/BlockManager.hpp>

#include <renderweave/log/TaggedLogger.hpp>

#include <algorithm>

namespace RW::Display {

namespace {

constexpr std::int64_t kZIndexStep = 20;

auto mergeable(GroupingKey const& lhs, GroupingKey const& rhs) -> bool {
    return lhs == rhs && !is_exclusive(lhs.renderer);
}

} // namespace

auto BlockManager::fit_mode_for(RendererKind kind) const -> FitMode {
    if (kind == RendererKind::WebGL && webgl_full_display_) {
        return FitMode::FullDisplay;
    }
    return FitMode::FitContent;
}

auto BlockManager::range(BlockId id) const -> DrawableRange {
    auto const& record = block(id);
    return DrawableRange{record.first, record.last, record.member_count};
}

auto BlockManager::touch(BlockId id, Pass& pass) -> void {
    if (pass.created.contains(id) || pass.snapshots.contains(id)) {
        return;
    }
    pass.snapshots.emplace(id, range(id));
    pass.touched.push_back(id);
}

auto BlockManager::acquire_block(GroupingKey key, Pass& pass) -> BlockId {
    BlockId id = kNoBlock;
    if (!free_list_.empty()) {
        id = free_list_.back();
        free_list_.pop_back();
    } else {
        id = static_cast<BlockId>(blocks_.size());
        blocks_.push_back(BlockRecord{});
    }
    auto& record = blocks_[id];
    record = BlockRecord{};
    record.key = key;
    record.fit_mode = fit_mode_for(key.renderer);
    record.in_use = true;
    ++active_count_;
    pass.created.insert(id);
    pass.touched.push_back(id);
    return id;
}

auto BlockManager::dispose_block(BlockId id, Pass& pass) -> void {
    if (!exists(id)) {
        return;
    }
    auto& record = blocks_[id];
    if (pass.created.erase(id) == 0) {
        BlockEvent event;
        event.block = id;
        event.key = record.key;
        event.fit_mode = record.fit_mode;
        event.z_index = record.z_index;
        auto const snapshot = pass.snapshots.find(id);
        event.old_range = snapshot != pass.snapshots.end() ? snapshot->second : range(id);
        pass.changes.disposed.push_back(event);
    }
    record = BlockRecord{};
    disposed_.push_back(id);
    --active_count_;
}

auto BlockManager::attach(DrawableStore& store, DrawableId drawable, BlockId block, Pass& pass) -> void {
    touch(block, pass);
    store.set_block(drawable, block);
    ++blocks_[block].member_count;
    pass.anchors[block].push_back(drawable);
}

auto BlockManager::detach(DrawableStore& store, DrawableId drawable, Pass& pass) -> void {
    auto const block = store.record(drawable).block;
    if (block == kNoBlock || !exists(block)) {
        store.set_block(drawable, kNoBlock);
        return;
    }
    touch(block, pass);
    store.set_block(drawable, kNoBlock);
    --blocks_[block].member_count;
}

auto BlockManager::relabel_run(DrawableStore& store, DrawableId start, BlockId from_block, BlockId to_block,
                               Pass& pass) -> void {
    for (auto cursor = start; cursor != kNoDrawable; cursor = store.next(cursor)) {
        auto const block = store.record(cursor).block;
        if (block == kNoBlock) {
            continue;
        }
        if (block != from_block) {
            break;
        }
        detach(store, cursor, pass);
        attach(store, cursor, to_block, pass);
    }
}

auto BlockManager::detach_region(DrawableStore& store, BlockRegion const& region, Pass& pass)
    -> Expected<DetachedRegion> {
    DetachedRegion detached{region.before, region.after, {}, {}};
    auto const left = region.before;
    auto const right = region.after;

    for (auto cursor = left == kNoDrawable ? store.head() : store.next(left); cursor != right;
         cursor = store.next(cursor)) {
        if (cursor == kNoDrawable || detached.span.size() > store.capacity()) {
            return std::unexpected(make_error("block region does not reach drawable " + std::to_string(right),
                                              Error::Code::ConsistencyViolation));
        }
        detached.span.push_back(cursor);
    }

    auto const left_block = left == kNoDrawable ? kNoBlock : store.record(left).block;
    auto const right_block = right == kNoDrawable ? kNoBlock : store.record(right).block;
    if (left != kNoDrawable && exists(left_block)) {
        pass.anchors[left_block].push_back(left);
    }
    if (right != kNoDrawable && exists(right_block)) {
        pass.anchors[right_block].push_back(right);
    }

    auto offer = [&](DrawableId drawable) {
        auto const block = store.record(drawable).block;
        if (region.reuse_blocks && block != kNoBlock && block != left_block && block != right_block
            && std::find(detached.reusable.begin(), detached.reusable.end(), block) == detached.reusable.end()) {
            detached.reusable.push_back(block);
        }
        detach(store, drawable, pass);
    };
    for (auto drawable : region.removed) {
        if (store.exists(drawable)) {
            offer(drawable);
        }
    }
    for (auto drawable : detached.span) {
        offer(drawable);
    }
    return detached;
}

auto BlockManager::assign_region(DrawableStore& store, DetachedRegion& region, Pass& pass) -> Expected<void> {
    auto const left = region.before;
    auto const right = region.after;
    // Read now: an earlier region may have relabelled either boundary.
    auto const left_block = left == kNoDrawable ? kNoBlock : store.record(left).block;
    auto const right_block = right == kNoDrawable ? kNoBlock : store.record(right).block;
    if ((left != kNoDrawable && !exists(left_block)) || (right != kNoDrawable && !exists(right_block))) {
        return std::unexpected(
            make_error("block region boundary has no block", Error::Code::ConsistencyViolation));
    }

    auto take_block = [&](GroupingKey key) -> BlockId {
        for (auto it = region.reusable.begin(); it != region.reusable.end(); ++it) {
            if (exists(*it) && blocks_[*it].member_count == 0 && blocks_[*it].key == key) {
                auto const block = *it;
                region.reusable.erase(it);
                touch(block, pass);
                return block;
            }
        }
        return acquire_block(key, pass);
    };

    auto        current = left_block;
    GroupingKey current_key = left == kNoDrawable ? GroupingKey{} : store.record(left).key();
    for (auto drawable : region.span) {
        auto const key = store.record(drawable).key();
        if (current == kNoBlock || !mergeable(current_key, key)) {
            current = take_block(key);
            current_key = key;
        }
        attach(store, drawable, current, pass);
    }

    if (right == kNoDrawable || current == right_block) {
        return {};
    }
    auto const right_key = store.record(right).key();
    if (current != kNoBlock && mergeable(current_key, right_key)) {
        relabel_run(store, right, right_block, current, pass);
        return {};
    }
    if (left != kNoDrawable && left_block == right_block) {
        // The left block was cut inside the region; its tail from `right`
        // onward becomes a block of its own.
        relabel_run(store, right, right_block, take_block(right_key), pass);
    }
    return {};
}

auto BlockManager::repartition(DrawableStore& store, std::vector<BlockRegion> const& regions)
    -> Expected<BlockChanges> {
    Pass pass;
    std::vector<DetachedRegion> detached;
    detached.reserve(regions.size());
    for (auto const& region : regions) {
        auto result = detach_region(store, region, pass);
        if (!result) {
            rw_log("Block repartition failed: " + describeError(result.error()), "Blocks", "Consistency");
            return std::unexpected(result.error());
        }
        detached.push_back(std::move(*result));
    }
    for (auto& region : detached) {
        if (auto status = assign_region(store, region, pass); !status) {
            rw_log("Block repartition failed: " + describeError(status.error()), "Blocks", "Consistency");
            return std::unexpected(status.error());
        }
    }
    return finish(store, pass);
}

auto BlockManager::rebuild_all(DrawableStore& store) -> Expected<BlockChanges> {
    Pass pass;
    for (BlockId id = 0; id < blocks_.size(); ++id) {
        if (blocks_[id].in_use) {
            touch(id, pass);
            blocks_[id].member_count = 0;
        }
    }
    DetachedRegion whole;
    whole.span = store.ordered_ids();
    for (auto drawable : whole.span) {
        store.set_block(drawable, kNoBlock);
    }
    if (auto status = assign_region(store, whole, pass); !status) {
        return std::unexpected(status.error());
    }
    return finish(store, pass);
}

auto BlockManager::refresh_range(DrawableStore const& store, BlockId id, Pass const& pass) -> void {
    auto& record = blocks_[id];
    auto carries = [&](DrawableId drawable) {
        return drawable != kNoDrawable && store.exists(drawable) && store.record(drawable).block == id;
    };

    DrawableId anchor = kNoDrawable;
    if (auto const found = pass.anchors.find(id); found != pass.anchors.end()) {
        for (auto drawable : found->second) {
            if (carries(drawable)) {
                anchor = drawable;
                break;
            }
        }
    }
    if (anchor == kNoDrawable) {
        if (auto const snapshot = pass.snapshots.find(id); snapshot != pass.snapshots.end()) {
            if (carries(snapshot->second.first)) {
                anchor = snapshot->second.first;
            } else if (carries(snapshot->second.last)) {
                anchor = snapshot->second.last;
            }
        }
    }
    if (anchor == kNoDrawable) {
        record.first = kNoDrawable;
        record.last = kNoDrawable;
        record.member_count = 0;
        return;
    }

    std::uint32_t count = 1;
    auto          first = anchor;
    while (carries(store.previous(first))) {
        first = store.previous(first);
        ++count;
    }
    auto last = anchor;
    while (carries(store.next(last))) {
        last = store.next(last);
        ++count;
    }
    record.first = first;
    record.last = last;
    record.member_count = count;
}

auto BlockManager::finish(DrawableStore const& store, Pass& pass) -> BlockChanges {
    for (auto id : pass.touched) {
        if (exists(id)) {
            refresh_range(store, id, pass);
        }
    }
    for (auto id : pass.touched) {
        if (exists(id) && blocks_[id].member_count == 0) {
            dispose_block(id, pass);
        }
    }

    if (!pass.touched.empty()) {
        // Reused blocks keep their old z-index and may now sit out of order.
        auto const order = ordered_blocks(store);
        reindex_z(order, pass);
        for (auto id : order) {
            if (pass.created.contains(id)) {
                auto const& record = blocks_[id];
                pass.changes.created.push_back(
                    BlockEvent{id, record.key, record.fit_mode, record.z_index, DrawableRange{}, range(id)});
            }
        }
    }
    for (auto id : pass.touched) {
        auto const snapshot = pass.snapshots.find(id);
        if (snapshot == pass.snapshots.end() || !exists(id)) {
            continue;
        }
        auto const now = range(id);
        if (now != snapshot->second) {
            auto const& record = blocks_[id];
            pass.changes.range_changed.push_back(
                BlockEvent{id, record.key, record.fit_mode, record.z_index, snapshot->second, now});
        }
    }

    if (pass.changes.total() > 0) {
        rw_log("Blocks: +" + std::to_string(pass.changes.created.size()) + " -"
                   + std::to_string(pass.changes.disposed.size()) + " ~"
                   + std::to_string(pass.changes.range_changed.size()),
               "Blocks");
    }
    return std::move(pass.changes);
}

auto BlockManager::reindex_z(std::vector<BlockId> const& order, Pass& pass) -> void {
    // Keep every z-index that is already above its predecessor; squeeze the
    // others into the gap before the next one, or step past the predecessor.
    std::int64_t previous = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        auto& record = blocks_[order[i]];
        if (record.z_index > previous) {
            previous = record.z_index;
            continue;
        }
        auto z = previous + kZIndexStep;
        if (i + 1 < order.size()) {
            auto const upper = blocks_[order[i + 1]].z_index;
            if (upper - previous >= 2) {
                z = previous + (upper - previous) / 2;
            }
        }
        if (!pass.created.contains(order[i])) {
            pass.changes.z_index_changed.push_back(ZIndexChange{order[i], record.key, record.z_index, z});
        }
        record.z_index = z;
        previous = z;
    }
}

auto BlockManager::ordered_blocks(DrawableStore const& store) const -> std::vector<BlockId> {
    std::vector<BlockId> order;
    auto cursor = store.head();
    while (cursor != kNoDrawable) {
        auto const id = store.record(cursor).block;
        if (!exists(id) || order.size() > blocks_.size()) {
            break;
        }
        order.push_back(id);
        auto const last = blocks_[id].last;
        if (!store.exists(last)) {
            break;
        }
        cursor = store.next(last);
    }
    return order;
}

auto BlockManager::members(DrawableStore const& store, BlockId id) const -> std::vector<DrawableId> {
    std::vector<DrawableId> result;
    auto const& record = block(id);
    for (auto cursor = record.first; cursor != kNoDrawable; cursor = store.next(cursor)) {
        result.push_back(cursor);
        if (cursor == record.last || result.size() > store.capacity()) {
            break;
        }
    }
    return result;
}

auto BlockManager::recycle_disposed() -> std::size_t {
    auto const count = disposed_.size();
    free_list_.insert(free_list_.end(), disposed_.begin(), disposed_.end());
    disposed_.clear();
    return count;
}

auto BlockManager::clear() -> void {
    blocks_.clear();
    free_list_.clear();
    disposed_.clear();
    active_count_ = 0;
}

} // namespace RW::Display
