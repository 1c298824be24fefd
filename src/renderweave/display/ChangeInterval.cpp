#include <renderweave/display/ChangeInterval.hpp>

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <numeric>

namespace RW::Display {

namespace {

auto first_inside(DrawableStore const& store, DrawableId before) -> DrawableId {
    return before == kNoDrawable ? store.head() : store.next(before);
}

} // namespace

auto ChangeIntervalList::record(DrawableStore& store, DrawableId before, DrawableId after, OrderKey start_key,
                                OrderKey end_key) -> Expected<std::uint32_t> {
    if (before != kNoDrawable && !store.attached(before)) {
        return std::unexpected(make_error("interval start boundary " + std::to_string(before)
                                              + " is not in the committed list",
                                          Error::Code::ConsistencyViolation));
    }
    if (after != kNoDrawable && !store.attached(after)) {
        return std::unexpected(make_error("interval end boundary " + std::to_string(after)
                                              + " is not in the committed list",
                                          Error::Code::ConsistencyViolation));
    }

    auto const index = static_cast<std::uint32_t>(recorded_.size());
    std::size_t steps = 0;
    auto cursor = first_inside(store, before);
    while (cursor != after) {
        if (cursor == kNoDrawable || ++steps > store.capacity()) {
            return std::unexpected(make_error("interval boundaries do not bound a span of the committed list",
                                              Error::Code::ConsistencyViolation));
        }
        if (store.record(cursor).interval_tag == kNoTag) {
            store.set_interval_tag(cursor, index);
            tagged_.push_back(cursor);
        }
        cursor = store.next(cursor);
    }

    ChangeInterval interval;
    interval.drawable_before = before;
    interval.drawable_after = after;
    interval.empty = steps == 0;
    interval.start_key = std::move(start_key);
    interval.end_key = std::move(end_key);
    recorded_.push_back(std::move(interval));
    return index;
}

auto ChangeIntervalList::merge(DrawableStore const& store) -> std::uint32_t {
    merged_.clear();
    head_ = kNoTag;
    if (recorded_.empty()) {
        return head_;
    }

    std::vector<std::uint32_t> order(recorded_.size());
    std::iota(order.begin(), order.end(), 0u);
    std::sort(order.begin(), order.end(), [this](std::uint32_t lhs, std::uint32_t rhs) {
        auto const& a = recorded_[lhs];
        auto const& b = recorded_[rhs];
        if (a.start_key != b.start_key) {
            return a.start_key < b.start_key;
        }
        if (a.end_key != b.end_key) {
            return a.end_key > b.end_key;
        }
        return lhs < rhs;
    });

    // Drawables strictly inside the current run, in committed order.
    phmap::flat_hash_set<DrawableId> covered;
    // Covers [from, to); false when the list ends before `to`.
    auto cover = [&](DrawableId from, DrawableId to) -> bool {
        std::size_t steps = 0;
        for (auto cursor = from; cursor != to; cursor = store.next(cursor)) {
            if (cursor == kNoDrawable || ++steps > store.capacity()) {
                return false;
            }
            covered.insert(cursor);
        }
        return true;
    };

    for (auto index : order) {
        auto const& interval = recorded_[index];
        if (!merged_.empty()) {
            auto& current = merged_.back();
            // Anything sharing a boundary with, or reaching into, the current
            // run is stitched together with it.
            bool const joins = interval.start_key < current.end_key
                               || current.drawable_after == kNoDrawable
                               || interval.drawable_before == kNoDrawable
                               || interval.drawable_before == current.drawable_before
                               || interval.drawable_before == current.drawable_after
                               || covered.contains(interval.drawable_before);
            if (joins) {
                if (interval.drawable_before == kNoDrawable && current.drawable_before != kNoDrawable) {
                    covered.insert(current.drawable_before);
                    cover(store.head(), current.drawable_before);
                    current.drawable_before = kNoDrawable;
                }
                if (current.drawable_after != kNoDrawable && interval.drawable_after != current.drawable_after
                    && !covered.contains(interval.drawable_after)) {
                    // The run grows up to the later end.
                    if (!cover(current.drawable_after, interval.drawable_after)) {
                        current.drawable_after = kNoDrawable;
                    } else {
                        current.drawable_after = interval.drawable_after;
                    }
                }
                current.end_key = std::max(current.end_key, interval.end_key);
                continue;
            }
        }
        ChangeInterval run;
        run.drawable_before = interval.drawable_before;
        run.drawable_after = interval.drawable_after;
        run.start_key = interval.start_key;
        run.end_key = interval.end_key;
        covered.clear();
        cover(first_inside(store, run.drawable_before), run.drawable_after);
        merged_.push_back(std::move(run));
    }

    for (std::size_t i = 0; i < merged_.size(); ++i) {
        auto& run = merged_[i];
        run.empty = first_inside(store, run.drawable_before) == run.drawable_after;
        run.next_change_interval = i + 1 < merged_.size() ? static_cast<std::uint32_t>(i + 1) : kNoTag;
    }
    head_ = 0;
    return head_;
}

auto ChangeIntervalList::escalate_to_full(DrawableStore const& store) -> std::uint32_t {
    merged_.clear();
    ChangeInterval whole;
    whole.empty = store.head() == kNoDrawable;
    whole.end_key = OrderKey{kNoTag};
    merged_.push_back(std::move(whole));
    head_ = 0;
    return head_;
}

auto ChangeIntervalList::clear(DrawableStore& store) -> void {
    store.clear_interval_tags(tagged_);
    tagged_.clear();
    recorded_.clear();
    merged_.clear();
    head_ = kNoTag;
}

} // namespace RW::Display
