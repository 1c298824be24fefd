#include <renderweave/display/Display.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace RW::Display;

namespace {

// Prints every notification it receives.
class PrintingPainter final : public BackendPainter {
public:
    explicit PrintingPainter(RendererKind kind) : kind_(kind) {}

    void notify_block_created(BlockView const& block) override {
        std::cout << "  [" << renderer_name(kind_) << "] created block " << block.block << " with "
                  << block.members.size() << " drawables, z=" << block.z_index << '\n';
    }
    void notify_block_disposed(BlockView const& block) override {
        std::cout << "  [" << renderer_name(kind_) << "] disposed block " << block.block << '\n';
    }
    void notify_block_range_changed(BlockView const& block, DrawableRange const& old_range,
                                    DrawableRange const& new_range) override {
        std::cout << "  [" << renderer_name(kind_) << "] block " << block.block << " range " << old_range.count
                  << " -> " << new_range.count << '\n';
    }
    void notify_drawable_dirty(BlockId block, DrawableHandle const& drawable, std::uint32_t dirty_flags) override {
        std::cout << "  [" << renderer_name(kind_) << "] drawable " << drawable.drawable << " in block " << block
                  << " dirty 0x" << std::hex << dirty_flags << std::dec << '\n';
    }

private:
    RendererKind kind_;
};

auto painted(std::string name, std::optional<RendererKind> preferred = std::nullopt) -> NodePtr {
    auto node = Node::create(std::move(name));
    node->set_painted(true);
    node->set_preferred_renderer(preferred);
    return node;
}

auto run(Display& display, std::string const& label) -> bool {
    std::cout << "== " << label << '\n';
    auto report = display.sync_and_stitch();
    if (!report) {
        std::cerr << "frame failed: " << describeError(report.error()) << '\n';
        return false;
    }
    std::cout << frame_report_to_json(*report).dump() << '\n' << display.describe_blocks();
    return true;
}

} // namespace

int main() {
    auto options = DisplayOptions::from_environment();
    options.audit_after_frame = true;
    Display display(options);
    for (auto kind : kAllRendererKinds) {
        display.set_painter(kind, std::make_shared<PrintingPainter>(kind));
    }

    auto root = Node::create("root");
    auto a = painted("a");
    auto b = painted("b");
    auto c = painted("c");
    if (!root->set_children({a, b, c}) || !display.set_root(root)) {
        return EXIT_FAILURE;
    }
    if (!run(display, "initial scene")) {
        return EXIT_FAILURE;
    }

    auto overlay = painted("overlay", RendererKind::SVG);
    if (!root->insert_child(1, overlay) || !run(display, "insert svg overlay")) {
        return EXIT_FAILURE;
    }

    if (!root->remove_child(*b) || !run(display, "remove b")) {
        return EXIT_FAILURE;
    }

    if (!root->set_children({c, overlay, a}) || !run(display, "reorder")) {
        return EXIT_FAILURE;
    }

    root->set_transform(Transform::translation(10.0f, 20.0f));
    if (!run(display, "move root")) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
