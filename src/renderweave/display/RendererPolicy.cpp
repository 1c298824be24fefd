#include <renderweave/display/RendererPolicy.hpp>

#include <renderweave/display/Node.hpp>

#include <array>

namespace RW::Display {

namespace {

constexpr std::array<RendererKind, kRendererKindCount> kFallbackOrder{
    RendererKind::Canvas,
    RendererKind::SVG,
    RendererKind::WebGL,
    RendererKind::DOM,
};

} // namespace

auto DefaultRendererPolicy::choose(Node const& node, std::uint32_t enabled_renderers) const
    -> std::optional<RendererKind> {
    auto const usable = node.supported_renderer_capabilities() & enabled_renderers;
    if (usable == Renderer::None) {
        return std::nullopt;
    }
    if (auto preferred = node.preferred_renderer(); preferred && Renderer::supports(usable, *preferred)) {
        return preferred;
    }
    for (auto kind : kFallbackOrder) {
        if (Renderer::supports(usable, kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace RW::Display
