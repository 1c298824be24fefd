#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

namespace RW::Display {

struct FrameReport {
    std::uint64_t frame_id = 0;
    std::size_t   intervals_recorded = 0;
    std::size_t   intervals_processed = 0;
    std::size_t   greedy_count = 0;
    std::size_t   rebuild_count = 0;
    std::size_t   blocks_changed = 0;
    std::size_t   blocks_created = 0;
    std::size_t   blocks_disposed = 0;
    std::size_t   drawables_dirty = 0;
    std::size_t   transforms_recomputed = 0;
    std::size_t   capability_failures = 0;
    // Frames that fell back to re-stitching the whole list.
    std::size_t   escalations = 0;
};

inline auto frame_report_to_json(FrameReport const& report) -> nlohmann::json {
    using nlohmann::json;

    json intervals{{"recorded", report.intervals_recorded},
                   {"processed", report.intervals_processed},
                   {"greedy", report.greedy_count},
                   {"rebuild", report.rebuild_count},
                   {"escalations", report.escalations}};

    json blocks{{"changed", report.blocks_changed},
                {"created", report.blocks_created},
                {"disposed", report.blocks_disposed}};

    json drawables{{"dirty", report.drawables_dirty},
                   {"transforms_recomputed", report.transforms_recomputed},
                   {"capability_failures", report.capability_failures}};

    json root{{"frame_id", report.frame_id}};
    root["intervals"] = std::move(intervals);
    root["blocks"]    = std::move(blocks);
    root["drawables"] = std::move(drawables);
    return root;
}

} // namespace RW::Display
