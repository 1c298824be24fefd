#include <renderweave/display/Display.hpp>

#include <renderweave/log/TaggedLogger.hpp>

#include <parallel_hashmap/phmap.h>

#include <cassert>
#include <sstream>

namespace RW::Display {

namespace {

auto consistency_error(std::string message) -> Error {
    return make_error(std::move(message), Error::Code::ConsistencyViolation);
}

} // namespace

Display::Display(DisplayOptions options, std::shared_ptr<RendererPolicy const> policy)
    : options_(options)
    , policy_(policy ? std::move(policy) : std::make_shared<DefaultRendererPolicy>())
    , sync_(tree_, store_, intervals_, *policy_, *this)
    , stitcher_(store_, tree_) {
    sync_.set_enabled_renderers(options_.enabled_renderers);
    stitcher_.set_options(StitchOptions{options_.greedy_enabled, options_.greedy_allow_adjacent_swap});
    blocks_.set_webgl_full_display(options_.webgl_full_display);
}

Display::~Display() {
    sync_.reset();
}

auto Display::set_root(NodePtr root) -> Expected<void> {
    if (in_frame_) {
        return std::unexpected(make_error("root replaced during a frame", Error::Code::ContractViolation));
    }
    sync_.replace_root(std::move(root));
    return {};
}

auto Display::set_painter(RendererKind kind, std::shared_ptr<BackendPainter> painter) -> void {
    painters_[renderer_index(kind)] = std::move(painter);
}

auto Display::set_enabled_renderers(std::uint32_t mask) -> Expected<void> {
    if (in_frame_) {
        return std::unexpected(make_error("renderers changed during a frame", Error::Code::ContractViolation));
    }
    if (mask == options_.enabled_renderers) {
        return {};
    }
    options_.enabled_renderers = mask;
    sync_.set_enabled_renderers(mask);
    for (auto id = tree_.root(); id != kNoInstance; id = tree_.preorder_next(id)) {
        tree_.mark_renderer_dirty(id);
    }
    return {};
}

auto Display::sync_and_stitch() -> Expected<FrameReport> {
    if (in_frame_) {
        return std::unexpected(make_error("sync_and_stitch called from inside a frame",
                                          Error::Code::ContractViolation));
    }
    in_frame_ = true;
    mutation_error_.reset();

    FrameReport report;
    report.frame_id = frame_id_ + 1;
    auto status = run_frame(report);
    in_frame_ = false;
    if (!status) {
        rw_log("Frame " + std::to_string(report.frame_id) + " aborted: " + describeError(status.error()),
               "Display", "Error");
        return std::unexpected(status.error());
    }
    frame_id_ = report.frame_id;
    last_report_ = report;

    if (mutation_error_) {
        auto error = *mutation_error_;
        mutation_error_.reset();
        return std::unexpected(error);
    }
    if (options_.audit_after_frame) {
        if (auto audited = audit(); !audited) {
            return std::unexpected(audited.error());
        }
    }
    return report;
}

auto Display::run_frame(FrameReport& report) -> Expected<void> {
    auto synced = sync_.sync();
    if (!synced) {
        return std::unexpected(synced.error());
    }
    auto& sync = *synced;
    report.intervals_recorded = sync.intervals_recorded;
    report.capability_failures = sync.capability_failures;

    std::vector<BlockRegion> regions;
    bool escalated = force_full_stitch_;
    if (sync.consistency_error) {
        report_consistency(*sync.consistency_error);
        escalated = true;
    }
    if (!escalated) {
        if (auto stitched = stitch_intervals(sync, report, regions); !stitched) {
            report_consistency(stitched.error());
            escalated = true;
        }
    }
    if (escalated) {
        if (auto stitched = stitch_everything(report); !stitched) {
            store_.discard_pending();
            intervals_.clear(store_);
            force_full_stitch_ = true;
            return std::unexpected(stitched.error());
        }
        force_full_stitch_ = false;
    }

    store_.commit_pending();

    auto changes = escalated ? blocks_.rebuild_all(store_) : blocks_.repartition(store_, regions);
    if (!changes) {
        report_consistency(changes.error());
        ++report.escalations;
        changes = blocks_.rebuild_all(store_);
        if (!changes) {
            intervals_.clear(store_);
            force_full_stitch_ = true;
            return std::unexpected(changes.error());
        }
    }
    report.blocks_created = changes->created.size();
    report.blocks_disposed = changes->disposed.size();
    report.blocks_changed = changes->total();

    report.transforms_recomputed = tree_.validate_transforms([this](DrawableId drawable) {
        store_.mark_dirty(drawable, DirtyFlags::Transform);
    });

    dispatch(*changes, report);

    intervals_.clear(store_);
    store_.release_disposed();
    tree_.recycle_released();
    blocks_.recycle_disposed();

    rw_log("Frame " + std::to_string(report.frame_id) + ": " + std::to_string(report.intervals_processed)
               + " intervals, " + std::to_string(report.greedy_count) + " greedy, "
               + std::to_string(report.rebuild_count) + " rebuilt, " + std::to_string(report.blocks_changed)
               + " block changes",
           "Display");
    return {};
}

auto Display::stitch_intervals(SyncResult& sync, FrameReport& report, std::vector<BlockRegion>& regions)
    -> Expected<void> {
    for (auto index = intervals_.merge(store_); index != kNoTag;
         index = intervals_.merged(index).next_change_interval) {
        auto stitched = stitcher_.stitch(intervals_.merged(index));
        if (!stitched) {
            return std::unexpected(stitched.error());
        }
        ++report.intervals_processed;
        if (stitched->strategy == StitchStrategy::None) {
            continue;
        }
        if (stitched->strategy == StitchStrategy::Greedy) {
            ++report.greedy_count;
        } else {
            ++report.rebuild_count;
        }
        regions.push_back(BlockRegion{stitched->before, stitched->after,
                                      stitched->strategy == StitchStrategy::Greedy,
                                      std::move(stitched->removed_ids)});
    }

    // Every drawable entering or leaving the list must have been placed by
    // some interval.
    for (auto drawable : sync.removed) {
        if (!store_.record(drawable).pending_touched) {
            return std::unexpected(
                consistency_error("removed drawable " + std::to_string(drawable) + " was outside every interval"));
        }
    }
    for (auto drawable : sync.created) {
        if (store_.exists(drawable) && store_.record(drawable).state == DrawableState::Unattached
            && !store_.record(drawable).pending_touched) {
            return std::unexpected(
                consistency_error("created drawable " + std::to_string(drawable) + " was outside every interval"));
        }
    }
    return {};
}

auto Display::stitch_everything(FrameReport& report) -> Expected<void> {
    store_.discard_pending();
    ++report.escalations;
    report.intervals_processed = 1;
    report.greedy_count = 0;
    report.rebuild_count = 0;

    auto const whole = intervals_.escalate_to_full(store_);
    auto stitched = stitcher_.stitch(intervals_.merged(whole), true);
    if (!stitched) {
        return std::unexpected(stitched.error());
    }
    if (stitched->strategy == StitchStrategy::Rebuild) {
        ++report.rebuild_count;
    }
    rw_log("Escalated frame " + std::to_string(report.frame_id) + " to a full stitch", "Consistency");
    return {};
}

auto Display::report_consistency(Error const& error) -> void {
    rw_log("Consistency violation: " + describeError(error), "Consistency", "Error");
    if (options_.strict_consistency) {
        assert(false && "drawable list consistency violation");
    }
}

auto Display::painter_for(RendererKind kind) const -> BackendPainter* {
    return painters_[renderer_index(kind)].get();
}

auto Display::view_of(BlockEvent const& event, bool with_members) const -> BlockView {
    BlockView view;
    view.block = event.block;
    view.key = event.key;
    view.fit_mode = event.fit_mode;
    view.z_index = event.z_index;
    if (with_members && blocks_.exists(event.block)) {
        for (auto drawable : blocks_.members(store_, event.block)) {
            view.members.push_back(DrawableHandle{drawable, store_.record(drawable).payload_handle});
        }
    }
    return view;
}

auto Display::dispatch(BlockChanges const& changes, FrameReport& report) -> void {
    for (auto const& event : changes.created) {
        if (auto* painter = painter_for(event.key.renderer)) {
            painter->notify_block_created(view_of(event, true));
        }
    }
    for (auto const& event : changes.disposed) {
        if (auto* painter = painter_for(event.key.renderer)) {
            painter->notify_block_disposed(view_of(event, false));
        }
    }
    for (auto const& event : changes.range_changed) {
        if (auto* painter = painter_for(event.key.renderer)) {
            painter->notify_block_range_changed(view_of(event, true), event.old_range, event.new_range);
        }
    }
    for (auto const& change : changes.z_index_changed) {
        if (auto* painter = painter_for(change.key.renderer); painter && blocks_.exists(change.block)) {
            auto const& record = blocks_.block(change.block);
            BlockEvent event{change.block, record.key, record.fit_mode, change.new_z_index, {}, {}};
            painter->notify_block_z_index_changed(view_of(event, false), change.old_z_index);
        }
    }

    auto const dirty = store_.take_dirty();
    phmap::flat_hash_map<BlockId, std::vector<DrawableId>> by_block;
    for (auto drawable : dirty) {
        by_block[store_.record(drawable).block].push_back(drawable);
    }
    for (auto block : blocks_.ordered_blocks(store_)) {
        auto it = by_block.find(block);
        if (it == by_block.end()) {
            continue;
        }
        auto* painter = painter_for(blocks_.block(block).key.renderer);
        for (auto drawable : it->second) {
            auto const& record = store_.record(drawable);
            if (painter != nullptr) {
                painter->notify_drawable_dirty(block, DrawableHandle{drawable, record.payload_handle},
                                               record.dirty_flags);
            }
            ++report.drawables_dirty;
        }
    }
    for (auto drawable : dirty) {
        store_.mark_clean(drawable);
    }
}

auto Display::painted_order() const -> std::vector<DrawableId> {
    std::vector<DrawableId> order;
    for (auto id = tree_.root(); id != kNoInstance; id = tree_.preorder_next(id)) {
        if (auto drawable = tree_.record(id).drawable; drawable != kNoDrawable) {
            order.push_back(drawable);
        }
    }
    return order;
}

auto Display::block_views() const -> std::vector<BlockView> {
    std::vector<BlockView> views;
    for (auto block : blocks_.ordered_blocks(store_)) {
        auto const& record = blocks_.block(block);
        views.push_back(view_of(BlockEvent{block, record.key, record.fit_mode, record.z_index, {}, {}}, true));
    }
    return views;
}

auto Display::drawable_of(InstanceId instance) const -> Expected<DrawableId> {
    if (!tree_.exists(instance)) {
        return std::unexpected(make_error("no instance " + std::to_string(instance), Error::Code::NoSuchInstance));
    }
    auto const drawable = tree_.record(instance).drawable;
    if (drawable == kNoDrawable) {
        return std::unexpected(
            make_error("instance " + std::to_string(instance) + " has no drawable", Error::Code::NoSuchDrawable));
    }
    return drawable;
}

auto Display::composed_transform(InstanceId instance) -> Expected<Transform> {
    if (!tree_.exists(instance)) {
        return std::unexpected(make_error("no instance " + std::to_string(instance), Error::Code::NoSuchInstance));
    }
    return tree_.composed_transform(instance);
}

auto Display::trail(InstanceId instance) const -> Expected<std::vector<NodeId>> {
    if (!tree_.exists(instance)) {
        return std::unexpected(make_error("no instance " + std::to_string(instance), Error::Code::NoSuchInstance));
    }
    return tree_.node_trail(instance);
}

auto Display::note_mutation(Node const& node) -> void {
    if (!in_frame_ || mutation_error_) {
        return;
    }
    rw_log("Node '" + node.name() + "' mutated during frame " + std::to_string(frame_id_ + 1), "Display", "Error");
    mutation_error_ = make_error("node '" + node.name() + "' mutated while a frame was running",
                                 Error::Code::MutationDeferred);
}

void Display::on_children_changed(Node& node) {
    note_mutation(node);
    for (auto id : tree_.instances_of(node)) {
        tree_.mark_structure_dirty(id);
    }
}

void Display::on_transform_changed(Node& node) {
    note_mutation(node);
    for (auto id : tree_.instances_of(node)) {
        tree_.mark_transform_dirty(id);
    }
}

void Display::on_paint_invalidated(Node& node, std::uint32_t dirty_flags) {
    note_mutation(node);
    for (auto id : tree_.instances_of(node)) {
        if (auto drawable = tree_.record(id).drawable; drawable != kNoDrawable) {
            store_.mark_dirty(drawable, dirty_flags);
        }
    }
}

void Display::on_renderer_state_changed(Node& node) {
    note_mutation(node);
    for (auto id : tree_.instances_of(node)) {
        tree_.mark_renderer_dirty(id);
    }
}

auto Display::describe_blocks() const -> std::string {
    std::ostringstream oss;
    for (auto block : blocks_.ordered_blocks(store_)) {
        auto const& record = blocks_.block(block);
        oss << "block " << block << ' ' << renderer_name(record.key.renderer) << '/' << record.key.group << ' '
            << fit_mode_name(record.fit_mode) << " z=" << record.z_index << " [";
        bool first = true;
        for (auto drawable : blocks_.members(store_, block)) {
            oss << (first ? "" : " ") << drawable;
            first = false;
        }
        oss << "]\n";
    }
    return oss.str();
}

auto Display::audit() const -> Expected<void> {
    if (store_.has_pending_changes()) {
        return std::unexpected(consistency_error("pending links left after commit"));
    }

    // Committed list: back-links, head/tail, and pre-order equivalence.
    auto const order = store_.ordered_ids();
    DrawableId previous = kNoDrawable;
    for (auto drawable : order) {
        auto const& record = store_.record(drawable);
        if (record.previous != previous) {
            return std::unexpected(consistency_error("drawable " + std::to_string(drawable) + " has a stale back-link"));
        }
        if (record.state != DrawableState::AttachedClean && record.state != DrawableState::AttachedDirty) {
            return std::unexpected(consistency_error("drawable " + std::to_string(drawable) + " is listed but not attached"));
        }
        if (record.pending_touched || record.pending_removal || record.interval_tag != kNoTag) {
            return std::unexpected(consistency_error("drawable " + std::to_string(drawable) + " kept stitch state"));
        }
        if (!tree_.exists(record.instance) || tree_.record(record.instance).drawable != drawable) {
            return std::unexpected(consistency_error("drawable " + std::to_string(drawable) + " lost its instance"));
        }
        previous = drawable;
    }
    if (store_.tail() != previous) {
        return std::unexpected(consistency_error("list tail is stale"));
    }
    if (order.size() != store_.active_count()) {
        return std::unexpected(consistency_error("list holds " + std::to_string(order.size()) + " of "
                                                 + std::to_string(store_.active_count()) + " drawables"));
    }
    if (order != painted_order()) {
        return std::unexpected(consistency_error("list order differs from the instance pre-order"));
    }

    // Blocks: contiguous, exactly covering the list, maximal, increasing z.
    std::size_t  index = 0;
    std::size_t  runs = 0;
    BlockId      previous_block = kNoBlock;
    std::int64_t previous_z = 0;
    while (index < order.size()) {
        auto const block = store_.record(order[index]).block;
        if (!blocks_.exists(block)) {
            return std::unexpected(consistency_error("drawable " + std::to_string(order[index]) + " has no block"));
        }
        auto const& record = blocks_.block(block);
        if (record.first != order[index]) {
            return std::unexpected(consistency_error("block " + std::to_string(block) + " has a stale first member"));
        }
        std::uint32_t members = 0;
        while (index < order.size() && store_.record(order[index]).block == block) {
            if (!(store_.record(order[index]).key() == record.key)) {
                return std::unexpected(
                    consistency_error("drawable " + std::to_string(order[index]) + " differs from its block key"));
            }
            ++members;
            ++index;
        }
        if (record.last != order[index - 1] || record.member_count != members) {
            return std::unexpected(consistency_error("block " + std::to_string(block) + " has a stale range"));
        }
        if (is_exclusive(record.key.renderer) && members != 1) {
            return std::unexpected(consistency_error("exclusive block " + std::to_string(block) + " is shared"));
        }
        if (previous_block != kNoBlock) {
            auto const& prior = blocks_.block(previous_block);
            if (prior.key == record.key && !is_exclusive(record.key.renderer)) {
                return std::unexpected(consistency_error("blocks " + std::to_string(previous_block) + " and "
                                                         + std::to_string(block) + " should be one"));
            }
        }
        if (record.z_index <= previous_z) {
            return std::unexpected(consistency_error("block " + std::to_string(block) + " z-index out of order"));
        }
        previous_z = record.z_index;
        previous_block = block;
        ++runs;
    }
    if (runs != blocks_.block_count()) {
        return std::unexpected(consistency_error(std::to_string(blocks_.block_count() - runs) + " blocks are detached"));
    }
    return {};
}

} // namespace RW::Display
