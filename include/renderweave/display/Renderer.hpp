#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace RW::Display {

enum class RendererKind : std::uint8_t {
    DOM = 0,
    SVG = 1,
    Canvas = 2,
    WebGL = 3,
};

inline constexpr std::size_t kRendererKindCount = 4;

inline constexpr std::array<RendererKind, kRendererKindCount> kAllRendererKinds{
    RendererKind::DOM,
    RendererKind::SVG,
    RendererKind::Canvas,
    RendererKind::WebGL,
};

// Capability bitmask, one bit per renderer kind.
namespace Renderer {

inline constexpr std::uint32_t None   = 0x0000'0000u;
inline constexpr std::uint32_t DOM    = 0x0000'0001u;
inline constexpr std::uint32_t SVG    = 0x0000'0002u;
inline constexpr std::uint32_t Canvas = 0x0000'0004u;
inline constexpr std::uint32_t WebGL  = 0x0000'0008u;
inline constexpr std::uint32_t All    = DOM | SVG | Canvas | WebGL;

inline constexpr auto bit(RendererKind kind) -> std::uint32_t {
    return 1u << static_cast<std::uint32_t>(kind);
}

inline constexpr bool supports(std::uint32_t mask, RendererKind kind) {
    return (mask & bit(kind)) != 0u;
}

inline constexpr bool is_dom(std::uint32_t mask) {
    return (mask & DOM) != 0u;
}

} // namespace Renderer

enum class FitMode : std::uint8_t {
    FullDisplay,
    FitContent,
};

// Two drawables may share a block only when their grouping keys compare equal.
struct GroupingKey {
    RendererKind  renderer = RendererKind::Canvas;
    std::uint32_t group = 0;

    friend constexpr bool operator==(GroupingKey const&, GroupingKey const&) = default;
};

// DOM content owns its element, so each DOM drawable gets a block of its own.
[[nodiscard]] inline constexpr auto is_exclusive(RendererKind kind) -> bool {
    return kind == RendererKind::DOM;
}

[[nodiscard]] inline constexpr auto renderer_index(RendererKind kind) -> std::size_t {
    return static_cast<std::size_t>(kind);
}

[[nodiscard]] inline auto renderer_name(RendererKind kind) -> std::string_view {
    switch (kind) {
    case RendererKind::DOM:
        return "dom";
    case RendererKind::SVG:
        return "svg";
    case RendererKind::Canvas:
        return "canvas";
    case RendererKind::WebGL:
        return "webgl";
    }
    return "unknown";
}

[[nodiscard]] inline auto renderer_from_name(std::string_view name) -> std::optional<RendererKind> {
    for (auto kind : kAllRendererKinds) {
        if (renderer_name(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline auto fit_mode_name(FitMode mode) -> std::string_view {
    return mode == FitMode::FullDisplay ? "full_display" : "fit_content";
}

} // namespace RW::Display
