#pragma once

#include <renderweave/display/Renderer.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace RW::Display {

struct DisplayOptions {
    std::uint32_t enabled_renderers = Renderer::All;
#ifdef NDEBUG
    bool strict_consistency = false;
#else
    bool strict_consistency = true;
#endif
    bool greedy_enabled = true;
    bool greedy_allow_adjacent_swap = true;
    bool webgl_full_display = true;
    bool audit_after_frame = false;

    // Defaults overridden by RENDERWEAVE_RENDERERS, RENDERWEAVE_STRICT_CONSISTENCY,
    // RENDERWEAVE_GREEDY, RENDERWEAVE_GREEDY_SWAP, RENDERWEAVE_WEBGL_FULL_DISPLAY
    // and RENDERWEAVE_AUDIT.
    [[nodiscard]] static auto from_environment() -> DisplayOptions;
};

// Unset is nullopt; empty or anything but 0/false/off/no is true.
[[nodiscard]] auto parse_truthy(char const* value) -> std::optional<bool>;
// Comma or space separated renderer names, e.g. "canvas,svg". Unknown names
// are ignored; nullopt when nothing usable was listed.
[[nodiscard]] auto parse_renderer_list(std::string_view text) -> std::optional<std::uint32_t>;

} // namespace RW::Display
