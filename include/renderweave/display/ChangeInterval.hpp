#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/DrawableStore.hpp>

#include <cstdint>
#include <vector>

namespace RW::Display {

// Position in the old instance tree, as the child-index path from the root.
// A path orders before its own extensions, which matches pre-order.
using OrderKey = std::vector<std::uint32_t>;

// Drawables strictly between drawable_before and drawable_after in the old
// order have changed. kNoDrawable stands for the start or end of the list.
struct ChangeInterval {
    DrawableId    drawable_before = kNoDrawable;
    DrawableId    drawable_after = kNoDrawable;
    bool          empty = true;
    std::uint32_t next_change_interval = kNoTag;

    // Old tree region the interval was recorded for: [start_key, end_key).
    OrderKey start_key;
    OrderKey end_key;

    [[nodiscard]] auto is_empty() const -> bool { return empty; }
};

// Collects the intervals recorded during a sync and merges them into sorted,
// disjoint runs chained through next_change_interval.
class ChangeIntervalList {
public:
    ChangeIntervalList() = default;

    // Tags the old drawables inside the interval. Fails with
    // ConsistencyViolation when the boundaries do not resolve to a span of the
    // committed list.
    auto record(DrawableStore& store, DrawableId before, DrawableId after, OrderKey start_key, OrderKey end_key)
        -> Expected<std::uint32_t>;

    // Sorts by old position and merges overlapping or touching intervals.
    // Returns the index of the first merged interval, or kNoTag.
    auto merge(DrawableStore const& store) -> std::uint32_t;

    // Replaces everything with a single interval spanning the whole list.
    auto escalate_to_full(DrawableStore const& store) -> std::uint32_t;

    [[nodiscard]] auto first() const -> std::uint32_t { return head_; }
    [[nodiscard]] auto merged(std::uint32_t index) const -> ChangeInterval const& { return merged_[index]; }
    [[nodiscard]] auto merged(std::uint32_t index) -> ChangeInterval& { return merged_[index]; }
    [[nodiscard]] auto recorded(std::uint32_t index) const -> ChangeInterval const& { return recorded_[index]; }
    [[nodiscard]] auto recorded_count() const -> std::size_t { return recorded_.size(); }
    [[nodiscard]] auto merged_count() const -> std::size_t { return merged_.size(); }
    [[nodiscard]] auto empty() const -> bool { return recorded_.empty(); }

    auto clear(DrawableStore& store) -> void;

private:
    std::vector<ChangeInterval> recorded_{};
    std::vector<ChangeInterval> merged_{};
    std::vector<DrawableId>     tagged_{};
    std::uint32_t               head_ = kNoTag;
};

} // namespace RW::Display
