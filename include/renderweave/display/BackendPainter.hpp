#pragma once

#include <renderweave/display/BlockManager.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/Renderer.hpp>

#include <cstdint>
#include <vector>

namespace RW::Display {

// What a painter is told about one drawable.
struct DrawableHandle {
    DrawableId    drawable = kNoDrawable;
    std::uint64_t payload = 0;

    friend bool operator==(DrawableHandle const&, DrawableHandle const&) = default;
};

struct BlockView {
    BlockId                     block = kNoBlock;
    GroupingKey                 key{};
    FitMode                     fit_mode = FitMode::FitContent;
    std::int64_t                z_index = 0;
    // Ordered members; empty for a disposed block.
    std::vector<DrawableHandle> members;
};

// Receives block and drawable changes for one renderer kind. Notifications for
// a frame arrive after the frame's list and blocks are committed: block
// creations, disposals, range changes and z-index changes first, then the
// dirty drawables grouped by block.
class BackendPainter {
public:
    virtual ~BackendPainter() = default;

    virtual void notify_block_created(BlockView const& block) = 0;
    virtual void notify_block_disposed(BlockView const& block) = 0;
    virtual void notify_block_range_changed(BlockView const& block, DrawableRange const& old_range,
                                            DrawableRange const& new_range) = 0;
    virtual void notify_drawable_dirty(BlockId block, DrawableHandle const& drawable, std::uint32_t dirty_flags) = 0;

    virtual void notify_block_z_index_changed(BlockView const& block, std::int64_t old_z_index) {
        (void)block;
        (void)old_z_index;
    }
};

} // namespace RW::Display
