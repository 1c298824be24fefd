#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/ChangeInterval.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/InstanceTree.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace RW::Display {

enum class StitchStrategy : std::uint8_t {
    None,
    Greedy,
    Rebuild,
};

[[nodiscard]] inline auto stitch_strategy_name(StitchStrategy strategy) -> std::string_view {
    switch (strategy) {
    case StitchStrategy::None:
        return "none";
    case StitchStrategy::Greedy:
        return "greedy";
    case StitchStrategy::Rebuild:
        return "rebuild";
    }
    return "unknown";
}

struct StitchOptions {
    bool greedy_enabled = true;
    // Lets the greedy pass absorb two neighbours trading places.
    bool allow_adjacent_swap = true;
};

struct StitchResult {
    StitchStrategy strategy = StitchStrategy::None;
    DrawableId     before = kNoDrawable;
    DrawableId     after = kNoDrawable;
    std::size_t    inserted = 0;
    std::size_t    removed = 0;
    std::size_t    moved = 0;
    // Drawables unlinked by this stitch; they still name their old block.
    std::vector<DrawableId> removed_ids;
};

// Repairs the pending order of one merged interval. Only the pending links of
// the interval's drawables and the inward links of its two boundaries are
// written; the committed order stays walkable until commit_pending().
class Stitcher {
public:
    Stitcher(DrawableStore& store, InstanceTree const& tree);

    auto set_options(StitchOptions const& options) -> void { options_ = options; }
    [[nodiscard]] auto options() const -> StitchOptions const& { return options_; }

    // Narrows the interval past unchanged drawables, then tries the greedy
    // strategy and falls back to a rebuild. Boundaries are updated in place.
    auto stitch(ChangeInterval& interval, bool force_rebuild = false) -> Expected<StitchResult>;

    // Committed drawables strictly between the boundaries.
    [[nodiscard]] auto old_span(DrawableId before, DrawableId after) const -> Expected<std::vector<DrawableId>>;
    // Drawables the instance tree now places strictly between the boundaries.
    [[nodiscard]] auto new_span(DrawableId before, DrawableId after) const -> Expected<std::vector<DrawableId>>;

private:
    auto constrict(ChangeInterval& interval, std::vector<DrawableId>& old_order,
                   std::vector<DrawableId>& new_order) const -> void;
    auto greedy(ChangeInterval const& interval, std::vector<DrawableId> const& old_order,
                std::vector<DrawableId> const& new_order, StitchResult& result) -> bool;
    auto rebuild(ChangeInterval const& interval, std::vector<DrawableId> const& old_order,
                 std::vector<DrawableId> const& new_order, StitchResult& result) -> Expected<void>;
    // Writes pending links for consecutive pairs whose committed neighbour differs.
    auto link_sequence(DrawableId before, std::vector<DrawableId> const& order, DrawableId after,
                       bool only_changed) -> void;
    [[nodiscard]] auto committed_next(DrawableId id) const -> DrawableId;

    DrawableStore&      store_;
    InstanceTree const& tree_;
    StitchOptions       options_{};
};

} // namespace RW::Display
