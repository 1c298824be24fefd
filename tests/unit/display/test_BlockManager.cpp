#include <renderweave/display/BlockManager.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace RW;
using namespace RW::Display;

namespace {

struct ListFixture {
    auto add(RendererKind kind, std::uint32_t group = 0) -> DrawableId {
        return store.acquire(0, kind, group, 0);
    }

    // Commits `order` as the whole list; anything in `removed` leaves it.
    auto commit(std::vector<DrawableId> const& order, std::vector<DrawableId> const& removed = {}) -> void {
        for (auto id : removed) {
            store.note_pending_removal(id);
            store.sever_pending(id);
        }
        DrawableId previous = kNoDrawable;
        for (auto id : order) {
            store.link_pending(previous, id);
            previous = id;
        }
        store.link_pending(previous, kNoDrawable);
        store.commit_pending();
    }

    auto partition() -> std::vector<std::vector<DrawableId>> {
        std::vector<std::vector<DrawableId>> result;
        for (auto block : blocks.ordered_blocks(store)) {
            result.push_back(blocks.members(store, block));
        }
        return result;
    }

    auto z_indices() -> std::vector<std::int64_t> {
        std::vector<std::int64_t> result;
        for (auto block : blocks.ordered_blocks(store)) {
            result.push_back(blocks.block(block).z_index);
        }
        return result;
    }

    DrawableStore store;
    BlockManager  blocks;
};

auto strictly_increasing(std::vector<std::int64_t> const& values) -> bool {
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i] <= values[i - 1]) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_SUITE("display.block_manager") {

TEST_CASE("rebuild_all partitions into maximal runs of equal key") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    auto s = f.add(RendererKind::SVG);
    auto c = f.add(RendererKind::Canvas);
    auto g = f.add(RendererKind::Canvas, 7);
    f.commit({a, b, s, c, g});

    auto changes = f.blocks.rebuild_all(f.store);
    REQUIRE(changes.has_value());
    CHECK(changes->created.size() == 4);
    CHECK(changes->disposed.empty());
    CHECK(f.blocks.block_count() == 4);
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a, b}, {s}, {c}, {g}});
    CHECK(strictly_increasing(f.z_indices()));

    auto const& first = changes->created.front();
    CHECK(first.new_range == DrawableRange{a, b, 2});
    CHECK(first.fit_mode == FitMode::FitContent);
}

TEST_CASE("DOM drawables never share a block") {
    ListFixture f;
    auto d1 = f.add(RendererKind::DOM);
    auto d2 = f.add(RendererKind::DOM);
    f.commit({d1, d2});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{d1}, {d2}});
}

TEST_CASE("fit mode follows the renderer") {
    BlockManager blocks;
    CHECK(blocks.fit_mode_for(RendererKind::WebGL) == FitMode::FullDisplay);
    CHECK(blocks.fit_mode_for(RendererKind::SVG) == FitMode::FitContent);
    blocks.set_webgl_full_display(false);
    CHECK(blocks.fit_mode_for(RendererKind::WebGL) == FitMode::FitContent);
}

TEST_CASE("removing a member shrinks its block") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    auto c = f.add(RendererKind::Canvas);
    f.commit({a, b, c});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());

    f.commit({a, c}, {b});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, c, true, {b}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.empty());
    CHECK(changes->disposed.empty());
    REQUIRE(changes->range_changed.size() == 1);
    CHECK(changes->range_changed.front().old_range == DrawableRange{a, c, 3});
    CHECK(changes->range_changed.front().new_range == DrawableRange{a, c, 2});
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a, c}});
}

TEST_CASE("a foreign key inside a block splits it in three") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    auto c = f.add(RendererKind::Canvas);
    f.commit({a, b, c});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    auto const original = f.store.record(a).block;
    auto const original_z = f.blocks.block(original).z_index;

    auto s = f.add(RendererKind::SVG);
    f.commit({a, s, b, c});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, b, true, {}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.size() == 2);
    CHECK(changes->range_changed.size() == 1);
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a}, {s}, {b, c}});
    CHECK(f.store.record(a).block == original);
    // The surviving block keeps its z-index; new ones stack above it.
    CHECK(f.blocks.block(original).z_index == original_z);
    CHECK(changes->z_index_changed.empty());
    CHECK(strictly_increasing(f.z_indices()));
}

TEST_CASE("removing the separator merges its neighbours") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto s = f.add(RendererKind::SVG);
    auto c = f.add(RendererKind::Canvas);
    f.commit({a, s, c});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    REQUIRE(f.blocks.block_count() == 3);

    f.commit({a, c}, {s});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, c, true, {s}}});
    REQUIRE(changes.has_value());
    CHECK(changes->disposed.size() == 2);
    CHECK(changes->created.empty());
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a, c}});
    CHECK(f.blocks.block_count() == 1);

    // Disposed slots come back only after recycling.
    CHECK(f.blocks.recycle_disposed() == 2);
}

TEST_CASE("an emptied block is reused by a new run of the same key") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto s1 = f.add(RendererKind::SVG);
    auto s2 = f.add(RendererKind::SVG);
    auto b = f.add(RendererKind::Canvas);
    f.commit({a, s1, s2, b});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    auto const svg_block = f.store.record(s1).block;

    auto s3 = f.add(RendererKind::SVG);
    f.commit({a, s3, b}, {s1, s2});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, b, true, {s1, s2}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.empty());
    CHECK(changes->disposed.empty());
    CHECK(f.store.record(s3).block == svg_block);
    REQUIRE(changes->range_changed.size() == 1);
    CHECK(changes->range_changed.front().new_range == DrawableRange{s3, s3, 1});
}

TEST_CASE("blocks are not reused when the region forbids it") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto s1 = f.add(RendererKind::SVG);
    auto b = f.add(RendererKind::Canvas);
    f.commit({a, s1, b});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());

    auto s2 = f.add(RendererKind::SVG);
    f.commit({a, s2, b}, {s1});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, b, false, {s1}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.size() == 1);
    CHECK(changes->disposed.size() == 1);
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a}, {s2}, {b}});
}

TEST_CASE("a new block at the front pushes z-indices up only where needed") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    f.commit({a});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());

    auto s = f.add(RendererKind::SVG);
    f.commit({s, a});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{kNoDrawable, a, true, {}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.size() == 1);
    CHECK(strictly_increasing(f.z_indices()));
    // The new block fits below the old one without renumbering it.
    CHECK(changes->z_index_changed.empty());
}

TEST_CASE("two regions cutting the same block leave three runs of it") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    auto c = f.add(RendererKind::Canvas);
    auto e = f.add(RendererKind::Canvas);
    f.commit({a, b, c, e});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    auto const original = f.store.record(a).block;

    auto x = f.add(RendererKind::SVG);
    auto y = f.add(RendererKind::SVG);
    f.commit({a, x, b, c, y, e});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, b, true, {}}, BlockRegion{c, e, true, {}}});
    REQUIRE(changes.has_value());
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a}, {x}, {b, c}, {y}, {e}});
    CHECK(f.blocks.block_count() == 5);
    CHECK(changes->created.size() == 4);
    CHECK(f.blocks.range(original) == DrawableRange{a, a, 1});
    CHECK(strictly_increasing(f.z_indices()));
    for (auto const& event : changes->created) {
        CHECK(event.new_range.count == f.blocks.members(f.store, event.block).size());
    }
}

TEST_CASE("a block cut by two regions keeps its middle run") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    auto c = f.add(RendererKind::Canvas);
    f.commit({a, b, c});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    auto const original = f.store.record(b).block;

    f.commit({b}, {a, c});
    auto changes =
        f.blocks.repartition(f.store, {BlockRegion{kNoDrawable, b, true, {a}}, BlockRegion{b, kNoDrawable, true, {c}}});
    REQUIRE(changes.has_value());
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{b}});
    CHECK(f.store.record(b).block == original);
    CHECK(changes->disposed.empty());
    REQUIRE(changes->range_changed.size() == 1);
    CHECK(changes->range_changed.front().new_range == DrawableRange{b, b, 1});
}

TEST_CASE("reused blocks out of z order are renumbered and reported") {
    ListFixture f;
    auto a = f.add(RendererKind::WebGL);
    auto b = f.add(RendererKind::Canvas);
    auto c = f.add(RendererKind::SVG);
    auto d = f.add(RendererKind::WebGL);
    f.commit({a, b, c, d});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());
    auto const canvas_block = f.store.record(b).block;
    auto const canvas_z = f.blocks.block(canvas_block).z_index;

    auto x = f.add(RendererKind::SVG);
    auto y = f.add(RendererKind::Canvas);
    f.commit({a, x, y, d}, {b, c});
    auto changes = f.blocks.repartition(f.store, {BlockRegion{a, d, true, {b, c}}});
    REQUIRE(changes.has_value());
    CHECK(changes->created.empty());
    CHECK(changes->disposed.empty());
    CHECK(f.partition() == std::vector<std::vector<DrawableId>>{{a}, {x}, {y}, {d}});
    // The canvas block now follows the svg block but had the lower z-index.
    CHECK(f.store.record(y).block == canvas_block);
    CHECK(strictly_increasing(f.z_indices()));
    REQUIRE(changes->z_index_changed.size() == 1);
    CHECK(changes->z_index_changed.front().block == canvas_block);
    CHECK(changes->z_index_changed.front().old_z_index == canvas_z);
    CHECK(changes->z_index_changed.front().new_z_index == f.blocks.block(canvas_block).z_index);
}

TEST_CASE("a region whose boundaries do not meet is a consistency violation") {
    ListFixture f;
    auto a = f.add(RendererKind::Canvas);
    auto b = f.add(RendererKind::Canvas);
    f.commit({a, b});
    REQUIRE(f.blocks.rebuild_all(f.store).has_value());

    auto changes = f.blocks.repartition(f.store, {BlockRegion{b, a, true, {}}});
    REQUIRE_FALSE(changes.has_value());
    CHECK(changes.error().code == Error::Code::ConsistencyViolation);
}

} // TEST_SUITE
