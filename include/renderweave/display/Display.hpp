#pragma once

#include <renderweave/core/Error.hpp>
#include <renderweave/display/BackendPainter.hpp>
#include <renderweave/display/BlockManager.hpp>
#include <renderweave/display/ChangeInterval.hpp>
#include <renderweave/display/DisplayOptions.hpp>
#include <renderweave/display/DrawableStore.hpp>
#include <renderweave/display/FrameReport.hpp>
#include <renderweave/display/InstanceTree.hpp>
#include <renderweave/display/Node.hpp>
#include <renderweave/display/RendererPolicy.hpp>
#include <renderweave/display/Stitcher.hpp>
#include <renderweave/display/TreeSync.hpp>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RW::Display {

// Frame driver. Mirrors a node tree into instances and drawables and keeps
// the drawable list and its block partition in sync with it, one frame at a
// time. Single-threaded: node mutations must happen between frames.
//
// A frame runs, in order: tree sync and interval recording, interval merge,
// per-interval stitching (greedy, then rebuild), the pending-link commit,
// block re-partitioning, transform validation, painter notification, and
// finally dirty-state cleanup.
class Display final : public NodeListener {
public:
    explicit Display(DisplayOptions options = DisplayOptions{},
                     std::shared_ptr<RendererPolicy const> policy = nullptr);
    ~Display() override;

    Display(Display const&)            = delete;
    Display& operator=(Display const&) = delete;

    // Takes effect at the next frame; passing nullptr empties the display.
    auto set_root(NodePtr root) -> Expected<void>;
    [[nodiscard]] auto root() const -> NodePtr const& { return sync_.root_node(); }

    auto set_painter(RendererKind kind, std::shared_ptr<BackendPainter> painter) -> void;
    auto set_enabled_renderers(std::uint32_t mask) -> Expected<void>;
    [[nodiscard]] auto options() const -> DisplayOptions const& { return options_; }

    // Runs one frame. Contract violations (node cycles, re-entrant calls)
    // return ContractViolation before anything is committed. A node mutated
    // while the frame was running yields MutationDeferred after the commit;
    // the mutation is picked up by the next frame.
    auto sync_and_stitch() -> Expected<FrameReport>;
    // The next frame re-stitches the whole list and re-partitions every block.
    auto request_full_resync() -> void { force_full_stitch_ = true; }

    // Checks every structural invariant of the committed state.
    [[nodiscard]] auto audit() const -> Expected<void>;
    [[nodiscard]] auto describe_blocks() const -> std::string;

    [[nodiscard]] auto drawable_order() const -> std::vector<DrawableId> { return store_.ordered_ids(); }
    // Drawables of painted instances in depth-first pre-order.
    [[nodiscard]] auto painted_order() const -> std::vector<DrawableId>;
    [[nodiscard]] auto block_views() const -> std::vector<BlockView>;

    [[nodiscard]] auto instances_of(Node const& node) const -> std::vector<InstanceId> {
        return tree_.instances_of(node);
    }
    [[nodiscard]] auto drawable_of(InstanceId instance) const -> Expected<DrawableId>;
    [[nodiscard]] auto composed_transform(InstanceId instance) -> Expected<Transform>;
    [[nodiscard]] auto trail(InstanceId instance) const -> Expected<std::vector<NodeId>>;

    [[nodiscard]] auto drawables() const -> DrawableStore const& { return store_; }
    [[nodiscard]] auto instances() const -> InstanceTree const& { return tree_; }
    [[nodiscard]] auto blocks() const -> BlockManager const& { return blocks_; }
    [[nodiscard]] auto frame_id() const -> std::uint64_t { return frame_id_; }
    [[nodiscard]] auto last_report() const -> FrameReport const& { return last_report_; }
    [[nodiscard]] auto has_pending_changes() const -> bool { return sync_.has_pending_changes(); }

    void on_children_changed(Node& node) override;
    void on_transform_changed(Node& node) override;
    void on_paint_invalidated(Node& node, std::uint32_t dirty_flags) override;
    void on_renderer_state_changed(Node& node) override;

private:
    auto run_frame(FrameReport& report) -> Expected<void>;
    auto stitch_intervals(SyncResult& sync, FrameReport& report, std::vector<BlockRegion>& regions)
        -> Expected<void>;
    auto stitch_everything(FrameReport& report) -> Expected<void>;
    auto report_consistency(Error const& error) -> void;
    auto note_mutation(Node const& node) -> void;
    auto view_of(BlockEvent const& event, bool with_members) const -> BlockView;
    auto painter_for(RendererKind kind) const -> BackendPainter*;
    auto dispatch(BlockChanges const& changes, FrameReport& report) -> void;

    DisplayOptions                        options_;
    std::shared_ptr<RendererPolicy const> policy_;
    DrawableStore                         store_;
    InstanceTree                          tree_;
    ChangeIntervalList                    intervals_;
    TreeSynchronizer                      sync_;
    Stitcher                              stitcher_;
    BlockManager                          blocks_;

    std::array<std::shared_ptr<BackendPainter>, kRendererKindCount> painters_{};

    bool                 in_frame_ = false;
    bool                 force_full_stitch_ = false;
    std::optional<Error> mutation_error_;
    std::uint64_t        frame_id_ = 0;
    FrameReport          last_report_{};
};

} // namespace RW::Display
