#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/Renderer.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <vector>

namespace RW::Display {

struct BlockRecord {
    GroupingKey   key{};
    FitMode       fit_mode = FitMode::FitContent;
    DrawableId    first = kNoDrawable;
    DrawableId    last = kNoDrawable;
    std::uint32_t member_count = 0;
    std::int64_t  z_index = 0;
    bool          in_use = false;
};

struct DrawableRange {
    DrawableId    first = kNoDrawable;
    DrawableId    last = kNoDrawable;
    std::uint32_t count = 0;

    friend bool operator==(DrawableRange const&, DrawableRange const&) = default;
};

struct BlockEvent {
    BlockId       block = kNoBlock;
    GroupingKey   key{};
    FitMode       fit_mode = FitMode::FitContent;
    std::int64_t  z_index = 0;
    DrawableRange old_range{};
    DrawableRange new_range{};
};

struct ZIndexChange {
    BlockId      block = kNoBlock;
    GroupingKey  key{};
    std::int64_t old_z_index = 0;
    std::int64_t new_z_index = 0;
};

struct BlockChanges {
    std::vector<BlockEvent>   created;
    std::vector<BlockEvent>   disposed;
    std::vector<BlockEvent>   range_changed;
    std::vector<ZIndexChange> z_index_changed;

    [[nodiscard]] auto total() const -> std::size_t {
        return created.size() + disposed.size() + range_changed.size();
    }
};

// Region of the committed list whose block assignment must be re-derived.
// Drawables strictly between the boundaries are reassigned; the boundaries'
// own blocks are split, extended or merged as the new keys require.
struct BlockRegion {
    DrawableId              before = kNoDrawable;
    DrawableId              after = kNoDrawable;
    // Blocks emptied by the region may be handed to new runs of the same key.
    bool                    reuse_blocks = false;
    std::vector<DrawableId> removed;
};

// Partitions the drawable list into maximal runs of equal grouping key.
// Block slots are recycled only after recycle_disposed(), once painters have
// seen the disposal.
class BlockManager {
public:
    BlockManager() = default;

    auto set_webgl_full_display(bool enabled) -> void { webgl_full_display_ = enabled; }
    [[nodiscard]] auto fit_mode_for(RendererKind kind) const -> FitMode;

    auto repartition(DrawableStore& store, std::vector<BlockRegion> const& regions) -> Expected<BlockChanges>;
    // Discards every block and partitions the whole list from scratch.
    auto rebuild_all(DrawableStore& store) -> Expected<BlockChanges>;

    [[nodiscard]] auto exists(BlockId id) const -> bool { return id < blocks_.size() && blocks_[id].in_use; }
    [[nodiscard]] auto block(BlockId id) const -> BlockRecord const& {
        assert(exists(id));
        return blocks_[id];
    }
    [[nodiscard]] auto range(BlockId id) const -> DrawableRange;
    [[nodiscard]] auto block_count() const -> std::size_t { return active_count_; }
    // Blocks in list order, found by hopping from each block's last member.
    [[nodiscard]] auto ordered_blocks(DrawableStore const& store) const -> std::vector<BlockId>;
    [[nodiscard]] auto members(DrawableStore const& store, BlockId id) const -> std::vector<DrawableId>;

    auto recycle_disposed() -> std::size_t;
    auto clear() -> void;

private:
    struct Pass {
        phmap::flat_hash_map<BlockId, DrawableRange>           snapshots;
        phmap::flat_hash_set<BlockId>                          created;
        std::vector<BlockId>                                   touched;
        // Drawables that were labelled with the block at some point of the
        // pass; one that still carries the label locates the block's run.
        phmap::flat_hash_map<BlockId, std::vector<DrawableId>> anchors;
        BlockChanges                                           changes;
    };

    // A region after its drawables were detached.
    struct DetachedRegion {
        DrawableId              before = kNoDrawable;
        DrawableId              after = kNoDrawable;
        std::vector<DrawableId> span;
        std::vector<BlockId>    reusable;
    };

    auto detach_region(DrawableStore& store, BlockRegion const& region, Pass& pass) -> Expected<DetachedRegion>;
    auto assign_region(DrawableStore& store, DetachedRegion& region, Pass& pass) -> Expected<void>;
    auto acquire_block(GroupingKey key, Pass& pass) -> BlockId;
    auto dispose_block(BlockId id, Pass& pass) -> void;
    auto touch(BlockId id, Pass& pass) -> void;
    auto attach(DrawableStore& store, DrawableId drawable, BlockId block, Pass& pass) -> void;
    auto detach(DrawableStore& store, DrawableId drawable, Pass& pass) -> void;
    // Moves the drawables labelled `from_block` from `start` onward into
    // `to_block`. Unassigned drawables of other regions are stepped over.
    auto relabel_run(DrawableStore& store, DrawableId start, BlockId from_block, BlockId to_block, Pass& pass)
        -> void;
    // Re-derives first, last and member count from the labels.
    auto refresh_range(DrawableStore const& store, BlockId id, Pass const& pass) -> void;
    auto finish(DrawableStore const& store, Pass& pass) -> BlockChanges;
    auto reindex_z(std::vector<BlockId> const& order, Pass& pass) -> void;

    std::vector<BlockRecord> blocks_{};
    std::vector<BlockId>     free_list_{};
    std::vector<BlockId>     disposed_{};
    std::size_t              active_count_ = 0;
    bool                     webgl_full_display_ = true;
};

} // namespace RW::Display
