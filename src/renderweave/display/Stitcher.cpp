#include <renderweave/display/Stitcher.hpp>

#include <renderweave/log/TaggedLogger.hpp>

#include <parallel_hashmap/phmap.h>

namespace RW::Display {

namespace {

using DrawableSet = phmap::flat_hash_set<DrawableId>;

auto consistency_error(std::string message) -> Error {
    return make_error(std::move(message), Error::Code::ConsistencyViolation);
}

} // namespace

Stitcher::Stitcher(DrawableStore& store, InstanceTree const& tree)
    : store_(store), tree_(tree) {}

auto Stitcher::old_span(DrawableId before, DrawableId after) const -> Expected<std::vector<DrawableId>> {
    std::vector<DrawableId> span;
    auto cursor = before == kNoDrawable ? store_.head() : store_.next(before);
    while (cursor != after) {
        if (cursor == kNoDrawable || span.size() > store_.capacity()) {
            return std::unexpected(consistency_error("old span does not reach drawable " + std::to_string(after)));
        }
        span.push_back(cursor);
        cursor = store_.next(cursor);
    }
    return span;
}

auto Stitcher::new_span(DrawableId before, DrawableId after) const -> Expected<std::vector<DrawableId>> {
    InstanceId cursor = tree_.root();
    if (before != kNoDrawable) {
        auto const owner = store_.exists(before) ? store_.record(before).instance : kNoInstance;
        if (owner == kNoInstance || !tree_.exists(owner) || tree_.record(owner).drawable != before) {
            return std::unexpected(
                consistency_error("boundary drawable " + std::to_string(before) + " is no longer in the tree"));
        }
        cursor = tree_.preorder_next(owner);
    }

    std::vector<DrawableId> span;
    std::size_t             steps = 0;
    while (cursor != kNoInstance) {
        if (++steps > tree_.capacity()) {
            return std::unexpected(consistency_error("instance walk does not terminate"));
        }
        auto const drawable = tree_.record(cursor).drawable;
        if (drawable != kNoDrawable) {
            if (drawable == after) {
                return span;
            }
            span.push_back(drawable);
        }
        cursor = tree_.preorder_next(cursor);
    }
    if (after != kNoDrawable) {
        return std::unexpected(
            consistency_error("boundary drawable " + std::to_string(after) + " is no longer in the tree"));
    }
    return span;
}

auto Stitcher::constrict(ChangeInterval& interval, std::vector<DrawableId>& old_order,
                         std::vector<DrawableId>& new_order) const -> void {
    std::size_t prefix = 0;
    while (prefix < old_order.size() && prefix < new_order.size() && old_order[prefix] == new_order[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < old_order.size() - prefix && suffix < new_order.size() - prefix
           && old_order[old_order.size() - 1 - suffix] == new_order[new_order.size() - 1 - suffix]) {
        ++suffix;
    }
    if (prefix > 0) {
        interval.drawable_before = old_order[prefix - 1];
    }
    if (suffix > 0) {
        interval.drawable_after = old_order[old_order.size() - suffix];
    }
    old_order.erase(old_order.end() - static_cast<std::ptrdiff_t>(suffix), old_order.end());
    old_order.erase(old_order.begin(), old_order.begin() + static_cast<std::ptrdiff_t>(prefix));
    new_order.erase(new_order.end() - static_cast<std::ptrdiff_t>(suffix), new_order.end());
    new_order.erase(new_order.begin(), new_order.begin() + static_cast<std::ptrdiff_t>(prefix));
    interval.empty = old_order.empty();
}

auto Stitcher::stitch(ChangeInterval& interval, bool force_rebuild) -> Expected<StitchResult> {
    auto old_order = old_span(interval.drawable_before, interval.drawable_after);
    if (!old_order) {
        return std::unexpected(old_order.error());
    }
    auto new_order = new_span(interval.drawable_before, interval.drawable_after);
    if (!new_order) {
        return std::unexpected(new_order.error());
    }
    constrict(interval, *old_order, *new_order);

    StitchResult result;
    result.before = interval.drawable_before;
    result.after = interval.drawable_after;
    if (old_order->empty() && new_order->empty()) {
        return result;
    }

    if (!force_rebuild && options_.greedy_enabled && greedy(interval, *old_order, *new_order, result)) {
        result.strategy = StitchStrategy::Greedy;
        rw_log("Greedy stitch: +" + std::to_string(result.inserted) + " -" + std::to_string(result.removed) + " ~"
                   + std::to_string(result.moved),
               "Stitch");
        return result;
    }

    result = StitchResult{};
    result.before = interval.drawable_before;
    result.after = interval.drawable_after;
    if (auto status = rebuild(interval, *old_order, *new_order, result); !status) {
        return std::unexpected(status.error());
    }
    result.strategy = StitchStrategy::Rebuild;
    rw_log("Rebuilt span of " + std::to_string(new_order->size()) + " drawables", "Stitch");
    return result;
}

auto Stitcher::greedy(ChangeInterval const& interval, std::vector<DrawableId> const& old_order,
                      std::vector<DrawableId> const& new_order, StitchResult& result) -> bool {
    DrawableSet const in_old(old_order.begin(), old_order.end());
    DrawableSet const in_new(new_order.begin(), new_order.end());

    std::vector<DrawableId> removals;
    std::vector<DrawableId> moved;
    std::size_t             insertions = 0;

    // A drawable can only leave the span by being removed, and only enter it
    // by being created; anything else is a move that greedy cannot place.
    auto removable = [&](DrawableId id) {
        return store_.record(id).pending_removal && !in_new.contains(id);
    };
    auto insertable = [&](DrawableId id) {
        return !in_old.contains(id) && store_.record(id).state == DrawableState::Unattached;
    };

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < old_order.size() && j < new_order.size()) {
        auto const old_id = old_order[i];
        auto const new_id = new_order[j];
        if (old_id == new_id) {
            ++i;
            ++j;
        } else if (removable(old_id)) {
            removals.push_back(old_id);
            ++i;
        } else if (insertable(new_id)) {
            ++insertions;
            ++j;
        } else if (options_.allow_adjacent_swap && i + 1 < old_order.size() && j + 1 < new_order.size()
                   && old_id == new_order[j + 1] && old_order[i + 1] == new_id) {
            moved.push_back(old_id);
            moved.push_back(new_id);
            i += 2;
            j += 2;
        } else {
            return false;
        }
    }
    for (; i < old_order.size(); ++i) {
        if (!removable(old_order[i])) {
            return false;
        }
        removals.push_back(old_order[i]);
    }
    for (; j < new_order.size(); ++j) {
        if (!insertable(new_order[j])) {
            return false;
        }
        ++insertions;
    }
    if (old_order.size() - removals.size() != new_order.size() - insertions) {
        return false;
    }

    for (auto id : removals) {
        store_.sever_pending(id);
    }
    link_sequence(interval.drawable_before, new_order, interval.drawable_after, true);
    for (auto id : moved) {
        store_.mark_dirty(id, DirtyFlags::Relinked);
    }
    result.inserted = insertions;
    result.removed = removals.size();
    result.moved = moved.size();
    result.removed_ids = std::move(removals);
    return true;
}

auto Stitcher::rebuild(ChangeInterval const& interval, std::vector<DrawableId> const& old_order,
                       std::vector<DrawableId> const& new_order, StitchResult& result) -> Expected<void> {
    DrawableSet const in_old(old_order.begin(), old_order.end());
    DrawableSet const in_new(new_order.begin(), new_order.end());

    for (auto id : old_order) {
        if (!in_new.contains(id) && !store_.record(id).pending_removal) {
            return std::unexpected(
                consistency_error("drawable " + std::to_string(id) + " left its span without being removed"));
        }
    }
    for (auto id : new_order) {
        if (!in_old.contains(id) && store_.attached(id)) {
            return std::unexpected(
                consistency_error("drawable " + std::to_string(id) + " entered its span from elsewhere"));
        }
    }

    for (auto id : old_order) {
        store_.sever_pending(id);
        if (!in_new.contains(id)) {
            ++result.removed;
            result.removed_ids.push_back(id);
        }
    }
    link_sequence(interval.drawable_before, new_order, interval.drawable_after, false);
    for (auto id : new_order) {
        store_.mark_dirty(id, DirtyFlags::Relinked);
        if (!in_old.contains(id)) {
            ++result.inserted;
        }
    }
    return {};
}

auto Stitcher::committed_next(DrawableId id) const -> DrawableId {
    if (id == kNoDrawable) {
        return store_.head();
    }
    if (!store_.attached(id)) {
        return kNoDrawable;
    }
    return store_.next(id);
}

auto Stitcher::link_sequence(DrawableId before, std::vector<DrawableId> const& order, DrawableId after,
                             bool only_changed) -> void {
    auto previous = before;
    auto link = [&](DrawableId next) {
        bool const fresh = next != kNoDrawable && !store_.attached(next);
        if (!only_changed || fresh || (previous != kNoDrawable && !store_.attached(previous))
            || committed_next(previous) != next) {
            store_.link_pending(previous, next);
        }
        previous = next;
    };
    for (auto id : order) {
        link(id);
    }
    link(after);
}

} // namespace RW::Display
