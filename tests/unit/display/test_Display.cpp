#include "DisplayTestHelper.hpp"

#include <renderweave/display/Display.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace RW;
using namespace RW::Display;
using namespace RW::Display::Test;

namespace {

using Partition = std::vector<std::vector<DrawableId>>;

// root (undrawn) with painted canvas children a, b, c.
struct AbcFixture : DisplayFixture {
    AbcFixture() {
        root = group("root");
        a = painted("a");
        b = painted("b");
        c = painted("c");
        REQUIRE(root->set_children({a, b, c}).has_value());
        REQUIRE(display.set_root(root).has_value());
        frame();
        reset_painters();
    }

    NodePtr root;
    NodePtr a;
    NodePtr b;
    NodePtr c;
};

} // namespace

TEST_SUITE("display.display") {

TEST_CASE("Scenario A: first painted leaf creates one interval and one block") {
    DisplayFixture f;
    auto root = group("root");
    REQUIRE(f.display.set_root(root).has_value());
    auto first = f.frame();
    CHECK(first.frame_id == 1);
    CHECK(first.blocks_changed == 0);
    CHECK(f.display.drawable_order().empty());

    auto leaf = painted("leaf");
    REQUIRE(root->add_child(leaf).has_value());
    auto report = f.frame();
    CHECK(report.frame_id == 2);
    CHECK(report.intervals_recorded == 1);
    CHECK(report.intervals_processed == 1);
    CHECK(report.greedy_count == 1);
    CHECK(report.rebuild_count == 0);
    CHECK(report.blocks_created == 1);
    CHECK(report.blocks_changed == 1);

    auto& canvas = f.painter(RendererKind::Canvas);
    REQUIRE(canvas.created.size() == 1);
    REQUIRE(canvas.created.front().members.size() == 1);
    CHECK(canvas.created.front().members.front().drawable == f.drawable(leaf));
    CHECK(canvas.created.front().members.front().payload == leaf->id());
    REQUIRE(canvas.dirty.size() == 1);
    CHECK(canvas.dirty.front().flags == DirtyFlags::Created);
    CHECK(canvas.log == std::vector<std::string>{"created", "dirty"});
}

TEST_CASE("Scenario B: removing the middle drawable is greedy and shrinks the block") {
    AbcFixture f;
    auto const ids = f.drawables({f.a, f.b, f.c});
    REQUIRE(f.block_members() == Partition{ids});

    REQUIRE(f.root->remove_child(*f.b).has_value());
    auto report = f.frame();
    CHECK(report.intervals_recorded == 1);
    CHECK(report.greedy_count == 1);
    CHECK(report.rebuild_count == 0);
    CHECK(f.display.drawable_order() == std::vector<DrawableId>{ids[0], ids[2]});
    CHECK(f.block_members() == Partition{{ids[0], ids[2]}});

    auto& canvas = f.painter(RendererKind::Canvas);
    CHECK(canvas.created.empty());
    REQUIRE(canvas.range_changed.size() == 1);
    CHECK(canvas.range_changed.front().old_range == DrawableRange{ids[0], ids[2], 3});
    CHECK(canvas.range_changed.front().new_range == DrawableRange{ids[0], ids[2], 2});
    CHECK(canvas.dirty.empty());
    CHECK(f.b->listener_count() == 0);
}

TEST_CASE("Scenario C: an incompatible insertion splits the block") {
    AbcFixture f;
    auto d = painted("d", RendererKind::SVG);
    REQUIRE(f.root->insert_child(1, d).has_value());
    auto report = f.frame();
    CHECK(report.greedy_count == 1);
    CHECK(report.blocks_created == 2);

    auto const ids = f.drawables({f.a, d, f.b, f.c});
    CHECK(f.display.drawable_order() == ids);
    CHECK(f.block_members() == Partition{{ids[0]}, {ids[1]}, {ids[2], ids[3]}});

    auto& svg = f.painter(RendererKind::SVG);
    REQUIRE(svg.created.size() == 1);
    CHECK(svg.created.front().members.size() == 1);
    REQUIRE(svg.dirty.size() == 1);
    CHECK(svg.dirty.front().drawable.drawable == ids[1]);

    auto& canvas = f.painter(RendererKind::Canvas);
    CHECK(canvas.created.size() == 1);
    REQUIRE(canvas.range_changed.size() == 1);
    CHECK(canvas.range_changed.front().new_range == DrawableRange{ids[0], ids[0], 1});
}

TEST_CASE("Scenario D: a rotation falls back to rebuild") {
    AbcFixture f;
    auto const ids = f.drawables({f.a, f.b, f.c});
    REQUIRE(f.root->set_children({f.c, f.a, f.b}).has_value());
    auto report = f.frame();
    CHECK(report.greedy_count == 0);
    CHECK(report.rebuild_count == 1);
    CHECK(f.display.drawable_order() == std::vector<DrawableId>{ids[2], ids[0], ids[1]});
    CHECK(f.block_members() == Partition{{ids[2], ids[0], ids[1]}});

    auto& canvas = f.painter(RendererKind::Canvas);
    CHECK(canvas.dirty.size() == 3);
    for (auto const& notice : canvas.dirty) {
        CHECK((notice.flags & DirtyFlags::Relinked) != 0);
    }
}

TEST_CASE("adjacent swap stays greedy unless disabled") {
    SUBCASE("enabled") {
        AbcFixture f;
        REQUIRE(f.root->move_child(0, 1).has_value());
        auto report = f.frame();
        CHECK(report.greedy_count == 1);
        CHECK(f.display.drawable_order() == f.drawables({f.b, f.a, f.c}));
    }
    SUBCASE("disabled") {
        auto options = DisplayFixture::test_options();
        options.greedy_allow_adjacent_swap = false;
        DisplayFixture f(options);
        auto root = group("root");
        auto a = painted("a");
        auto b = painted("b");
        REQUIRE(root->set_children({a, b}).has_value());
        REQUIRE(f.display.set_root(root).has_value());
        f.frame();
        REQUIRE(root->move_child(0, 1).has_value());
        auto report = f.frame();
        CHECK(report.rebuild_count == 1);
        CHECK(f.display.drawable_order() == f.drawables({b, a}));
    }
}

TEST_CASE("a second frame without mutations does nothing") {
    AbcFixture f;
    auto report = f.frame();
    CHECK(report.intervals_recorded == 0);
    CHECK(report.intervals_processed == 0);
    CHECK(report.blocks_changed == 0);
    CHECK(report.drawables_dirty == 0);
    CHECK(f.painter(RendererKind::Canvas).log.empty());
    CHECK_FALSE(f.display.has_pending_changes());
}

TEST_CASE("paint invalidation reaches the painter with its flags") {
    AbcFixture f;
    f.b->mark_paint_dirty(DirtyFlags::Bounds);
    auto report = f.frame();
    CHECK(report.intervals_recorded == 0);
    CHECK(report.drawables_dirty == 1);
    auto& canvas = f.painter(RendererKind::Canvas);
    REQUIRE(canvas.dirty.size() == 1);
    CHECK(canvas.dirty.front().drawable.drawable == f.drawable(f.b));
    CHECK(canvas.dirty.front().flags == DirtyFlags::Bounds);
    CHECK(canvas.dirty.front().block == f.display.drawables().record(f.drawable(f.b)).block);
}

TEST_CASE("dirty drawables are delivered grouped by block in list order") {
    AbcFixture f;
    auto d = painted("d", RendererKind::SVG);
    REQUIRE(f.root->insert_child(1, d).has_value());
    f.frame();
    f.reset_painters();

    f.c->mark_paint_dirty();
    f.a->mark_paint_dirty();
    d->mark_paint_dirty();
    f.frame();
    auto& canvas = f.painter(RendererKind::Canvas);
    REQUIRE(canvas.dirty.size() == 2);
    CHECK(canvas.dirty[0].drawable.drawable == f.drawable(f.a));
    CHECK(canvas.dirty[1].drawable.drawable == f.drawable(f.c));
    CHECK(f.painter(RendererKind::SVG).dirty.size() == 1);
}

TEST_CASE("transform changes dirty the subtree and compose lazily") {
    DisplayFixture f;
    auto root = group("root");
    auto mid = group("mid");
    auto leaf = painted("leaf");
    auto other = painted("other");
    REQUIRE(mid->add_child(leaf).has_value());
    REQUIRE(root->set_children({mid, other}).has_value());
    REQUIRE(f.display.set_root(root).has_value());
    f.frame();
    f.reset_painters();

    mid->set_transform(Transform::translation(3.0f, 4.0f));
    auto const instance = f.display.instances_of(*leaf).front();
    auto composed = f.display.composed_transform(instance);
    REQUIRE(composed.has_value());
    CHECK(*composed == Transform::translation(3.0f, 4.0f));

    auto report = f.frame();
    CHECK(report.intervals_recorded == 0);
    auto& canvas = f.painter(RendererKind::Canvas);
    REQUIRE(canvas.dirty.size() == 1);
    CHECK(canvas.dirty.front().drawable.drawable == f.drawable(leaf));
    CHECK(canvas.dirty.front().flags == DirtyFlags::Transform);

    // An identical transform is not a change.
    mid->set_transform(Transform::translation(3.0f, 4.0f));
    CHECK(f.frame().transforms_recomputed == 0);
}

TEST_CASE("switching renderer replaces the drawable in place") {
    AbcFixture f;
    auto const old_b = f.drawable(f.b);
    f.b->set_preferred_renderer(RendererKind::WebGL);
    auto report = f.frame();
    CHECK(report.intervals_recorded == 1);
    CHECK(report.greedy_count == 1);

    auto const new_b = f.drawable(f.b);
    CHECK(new_b != old_b);
    CHECK(f.display.drawables().record(new_b).renderer == RendererKind::WebGL);
    auto const ids = f.drawables({f.a, f.b, f.c});
    CHECK(f.display.drawable_order() == ids);
    CHECK(f.block_members() == Partition{{ids[0]}, {ids[1]}, {ids[2]}});

    auto& webgl = f.painter(RendererKind::WebGL);
    REQUIRE(webgl.created.size() == 1);
    CHECK(webgl.created.front().fit_mode == FitMode::FullDisplay);
}

TEST_CASE("block groups keep same-renderer drawables apart") {
    AbcFixture f;
    f.b->set_block_group(3);
    f.frame();
    auto const ids = f.drawables({f.a, f.b, f.c});
    CHECK(f.block_members() == Partition{{ids[0]}, {ids[1]}, {ids[2]}});

    f.b->set_block_group(0);
    f.frame();
    CHECK(f.block_members() == Partition{f.drawables({f.a, f.b, f.c})});
}

TEST_CASE("DOM drawables get a block each") {
    DisplayFixture f;
    auto root = group("root");
    auto d1 = painted("d1", RendererKind::DOM);
    auto d2 = painted("d2", RendererKind::DOM);
    REQUIRE(root->set_children({d1, d2}).has_value());
    REQUIRE(f.display.set_root(root).has_value());
    f.frame();
    CHECK(f.block_members() == Partition{{f.drawable(d1)}, {f.drawable(d2)}});
    CHECK(f.painter(RendererKind::DOM).created.size() == 2);
}

TEST_CASE("unpainting and repainting a node") {
    AbcFixture f;
    f.b->set_painted(false);
    f.frame();
    CHECK(f.display.drawable_order() == f.drawables({f.a, f.c}));
    auto const instance = f.display.instances_of(*f.b).front();
    auto missing = f.display.drawable_of(instance);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NoSuchDrawable);

    f.b->set_painted(true);
    f.frame();
    CHECK(f.display.drawable_order() == f.drawables({f.a, f.b, f.c}));
    CHECK(f.block_members().size() == 1);
}

TEST_CASE("capability failure degrades the node until a renderer is enabled") {
    auto options = DisplayFixture::test_options();
    options.enabled_renderers = Renderer::Canvas | Renderer::SVG;
    DisplayFixture f(options);
    auto root = group("root");
    auto gl = painted("gl");
    gl->set_supported_renderers(Renderer::WebGL);
    auto plain = painted("plain");
    REQUIRE(root->set_children({gl, plain}).has_value());
    REQUIRE(f.display.set_root(root).has_value());

    auto report = f.frame();
    CHECK(report.capability_failures == 1);
    REQUIRE(gl->last_capability_failure().has_value());
    CHECK(gl->last_capability_failure()->code == Error::Code::CapabilityMismatch);
    auto const instance = f.display.instances_of(*gl).front();
    CHECK(f.display.instances().record(instance).degraded);
    CHECK(f.display.drawable_order() == f.drawables({plain}));

    REQUIRE(f.display.set_enabled_renderers(Renderer::All).has_value());
    report = f.frame();
    CHECK(report.capability_failures == 0);
    CHECK_FALSE(f.display.instances().record(instance).degraded);
    CHECK(f.display.drawable_order() == f.drawables({gl, plain}));
    CHECK(f.painter(RendererKind::WebGL).created.size() == 1);
}

TEST_CASE("disabling a renderer moves its drawables to a fallback") {
    AbcFixture f;
    REQUIRE(f.display.set_enabled_renderers(Renderer::SVG).has_value());
    f.frame();
    for (auto id : f.display.drawable_order()) {
        CHECK(f.display.drawables().record(id).renderer == RendererKind::SVG);
    }
    CHECK(f.block_members().size() == 1);
    CHECK(f.painter(RendererKind::Canvas).disposed.size() == 1);
}

TEST_CASE("shared nodes get one instance per position") {
    DisplayFixture f;
    auto root = group("root");
    auto left = group("left");
    auto right = group("right");
    auto shared = painted("shared");
    REQUIRE(left->add_child(shared).has_value());
    REQUIRE(right->add_child(shared).has_value());
    REQUIRE(root->set_children({left, right}).has_value());
    REQUIRE(f.display.set_root(root).has_value());
    f.frame();
    f.reset_painters();

    auto const instances = f.display.instances_of(*shared);
    REQUIRE(instances.size() == 2);
    CHECK(f.display.drawable_order().size() == 2);
    CHECK(shared->listener_count() == 1);

    shared->mark_paint_dirty();
    f.frame();
    CHECK(f.painter(RendererKind::Canvas).dirty.size() == 2);
    f.reset_painters();

    right->set_transform(Transform::translation(1.0f, 0.0f));
    f.frame();
    auto& canvas = f.painter(RendererKind::Canvas);
    REQUIRE(canvas.dirty.size() == 1);
    auto const right_drawable = f.display.drawable_of(instances[1]);
    REQUIRE(right_drawable.has_value());
    CHECK(canvas.dirty.front().drawable.drawable == *right_drawable);

    // Children added to the shared node appear under both positions.
    REQUIRE(shared->add_child(painted("inner")).has_value());
    f.frame();
    CHECK(f.display.drawable_order().size() == 4);

    REQUIRE(right->remove_child(*shared).has_value());
    f.frame();
    CHECK(f.display.instances_of(*shared).size() == 1);
    CHECK(f.display.drawable_order().size() == 2);
    CHECK(shared->listener_count() == 1);
}

TEST_CASE("trail and instance lookups") {
    AbcFixture f;
    auto const instance = f.display.instances_of(*f.b).front();
    auto trail = f.display.trail(instance);
    REQUIRE(trail.has_value());
    CHECK(*trail == std::vector<NodeId>{f.root->id(), f.b->id()});

    auto bad = f.display.trail(9999);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == Error::Code::NoSuchInstance);
    CHECK(f.display.drawable_of(9999).error().code == Error::Code::NoSuchInstance);
    CHECK_FALSE(f.display.composed_transform(9999).has_value());
}

TEST_CASE("replacing and clearing the root") {
    AbcFixture f;
    auto other = group("other");
    auto x = painted("x", RendererKind::SVG);
    REQUIRE(other->add_child(x).has_value());
    REQUIRE(f.display.set_root(other).has_value());
    auto report = f.frame();
    CHECK(report.intervals_recorded == 1);
    CHECK(f.display.drawable_order() == f.drawables({x}));
    CHECK(f.painter(RendererKind::Canvas).disposed.size() == 1);
    CHECK(f.a->listener_count() == 0);
    CHECK(f.root->listener_count() == 0);

    REQUIRE(f.display.set_root(nullptr).has_value());
    f.frame();
    CHECK(f.display.drawable_order().empty());
    CHECK(f.display.blocks().block_count() == 0);
    CHECK(x->listener_count() == 0);
}

TEST_CASE("destroying the display detaches it from every node") {
    auto root = group("root");
    auto leaf = painted("leaf");
    REQUIRE(root->add_child(leaf).has_value());
    {
        DisplayFixture f;
        REQUIRE(f.display.set_root(root).has_value());
        f.frame();
        CHECK(leaf->listener_count() == 1);
    }
    CHECK(leaf->listener_count() == 0);
    CHECK(root->listener_count() == 0);
}

TEST_CASE("a full resync escalates without changing the result") {
    AbcFixture f;
    auto d = painted("d", RendererKind::SVG);
    REQUIRE(f.root->insert_child(1, d).has_value());
    f.frame();
    auto const order = f.display.drawable_order();
    auto const partition = f.block_members();

    f.display.request_full_resync();
    auto report = f.frame();
    CHECK(report.escalations == 1);
    CHECK(f.display.drawable_order() == order);
    CHECK(f.block_members() == partition);

    CHECK(f.frame().escalations == 0);
}

TEST_CASE("describe_blocks lists blocks in order") {
    AbcFixture f;
    auto d = painted("d", RendererKind::SVG);
    REQUIRE(f.root->insert_child(1, d).has_value());
    f.frame();
    auto text = f.display.describe_blocks();
    auto const canvas = text.find("canvas/0");
    auto const svg = text.find("svg/0");
    REQUIRE(canvas != std::string::npos);
    REQUIRE(svg != std::string::npos);
    CHECK(canvas < svg);
    CHECK(text.find("fit_content") != std::string::npos);
}

TEST_CASE("frame report is mirrored by last_report") {
    AbcFixture f;
    REQUIRE(f.root->remove_child(*f.a).has_value());
    auto report = f.frame();
    CHECK(f.display.last_report().frame_id == report.frame_id);
    CHECK(f.display.frame_id() == report.frame_id);
    auto json = frame_report_to_json(f.display.last_report());
    CHECK(json["intervals"]["greedy"].get<std::size_t>() == 1);
}

} // TEST_SUITE
