#pragma once

#include <renderweave/display/Node.hpp>
#include <renderweave/display/Renderer.hpp>

#include <cassert>
#include <cstdint>
#include <limits>
#include <vector>

namespace RW::Display {

using DrawableId = std::uint32_t;
using InstanceId = std::uint32_t;
using BlockId    = std::uint32_t;

inline constexpr DrawableId kNoDrawable = std::numeric_limits<DrawableId>::max();
inline constexpr InstanceId kNoInstance = std::numeric_limits<InstanceId>::max();
inline constexpr BlockId    kNoBlock    = std::numeric_limits<BlockId>::max();
inline constexpr std::uint32_t kNoTag   = std::numeric_limits<std::uint32_t>::max();

// unattached -> attached(dirty) <-> attached(clean) -> disposed
enum class DrawableState : std::uint8_t {
    Unattached,
    AttachedClean,
    AttachedDirty,
    Disposed,
};

struct DrawableRecord {
    RendererKind  renderer = RendererKind::Canvas;
    std::uint32_t capabilities = Renderer::None;
    std::uint32_t group = 0;
    InstanceId    instance = kNoInstance;
    BlockId       block = kNoBlock;
    std::uint64_t payload_handle = 0;
    DrawableState state = DrawableState::Unattached;
    std::uint32_t dirty_flags = DirtyFlags::None;

    // Committed order, the one blocks and painters see.
    DrawableId previous = kNoDrawable;
    DrawableId next = kNoDrawable;
    // Order being assembled by the current stitch pass.
    DrawableId pending_previous = kNoDrawable;
    DrawableId pending_next = kNoDrawable;

    bool          pending_touched = false;
    bool          pending_removal = false;
    std::uint32_t interval_tag = kNoTag;
    bool          in_use = false;

    [[nodiscard]] auto key() const -> GroupingKey {
        return GroupingKey{renderer, group};
    }
};

// Arena of drawables. Slots are recycled through a free list; a disposed
// drawable keeps its slot until release_disposed() so that stale ids stay
// detectable for the rest of the frame.
class DrawableStore {
public:
    DrawableStore() = default;

    auto acquire(InstanceId instance, RendererKind renderer, std::uint32_t group, std::uint64_t payload_handle)
        -> DrawableId;
    auto release(DrawableId id) -> void;

    // Marks the drawable as leaving the list; it is unlinked by the next stitch.
    auto note_pending_removal(DrawableId id) -> void;
    auto dispose(DrawableId id) -> void;
    auto release_disposed() -> std::size_t;

    // Returns true when the drawable moved from clean to dirty.
    auto mark_dirty(DrawableId id, std::uint32_t flags) -> bool;
    auto mark_clean(DrawableId id) -> void;
    auto take_dirty() -> std::vector<DrawableId>;

    // Pending-order editing. kNoDrawable on either side stands for the list edge.
    auto link_pending(DrawableId previous, DrawableId next) -> void;
    auto sever_pending(DrawableId id) -> void;
    [[nodiscard]] auto pending_next(DrawableId id) const -> DrawableId;
    [[nodiscard]] auto pending_previous(DrawableId id) const -> DrawableId;
    [[nodiscard]] auto pending_head() const -> DrawableId;
    [[nodiscard]] auto touched() const -> std::vector<DrawableId> const& { return touched_; }
    [[nodiscard]] auto has_pending_changes() const -> bool {
        return !touched_.empty() || pending_head_set_ || pending_tail_set_;
    }
    // Swaps every pending link into the committed fields at once.
    auto commit_pending() -> std::vector<DrawableId>;
    auto discard_pending() -> void;

    [[nodiscard]] auto head() const -> DrawableId { return head_; }
    [[nodiscard]] auto tail() const -> DrawableId { return tail_; }
    [[nodiscard]] auto next(DrawableId id) const -> DrawableId;
    [[nodiscard]] auto previous(DrawableId id) const -> DrawableId;

    [[nodiscard]] auto exists(DrawableId id) const -> bool {
        return id < records_.size() && records_[id].in_use;
    }
    [[nodiscard]] auto attached(DrawableId id) const -> bool;
    [[nodiscard]] auto record(DrawableId id) const -> DrawableRecord const& {
        assert(exists(id));
        return records_[id];
    }
    [[nodiscard]] auto record(DrawableId id) -> DrawableRecord& {
        assert(exists(id));
        return records_[id];
    }

    auto set_block(DrawableId id, BlockId block) -> void;
    auto set_interval_tag(DrawableId id, std::uint32_t tag) -> void;
    auto clear_interval_tags(std::vector<DrawableId> const& ids) -> void;

    [[nodiscard]] auto active_count() const -> std::size_t { return active_count_; }
    [[nodiscard]] auto capacity() const -> std::size_t { return records_.size(); }
    // Committed order from head to tail.
    [[nodiscard]] auto ordered_ids() const -> std::vector<DrawableId>;

    auto clear() -> void;

private:
    auto ensure_slot() -> DrawableId;
    auto touch(DrawableId id) -> void;

    std::vector<DrawableRecord> records_{};
    std::vector<DrawableId>     free_list_{};
    std::vector<DrawableId>     disposed_{};
    std::vector<DrawableId>     dirty_{};
    std::vector<DrawableId>     touched_{};
    std::size_t                 active_count_ = 0;

    DrawableId head_ = kNoDrawable;
    DrawableId tail_ = kNoDrawable;
    DrawableId pending_head_ = kNoDrawable;
    DrawableId pending_tail_ = kNoDrawable;
    bool       pending_head_set_ = false;
    bool       pending_tail_set_ = false;
};

} // namespace RW::Display
