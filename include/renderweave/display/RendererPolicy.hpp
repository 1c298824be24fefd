#pragma once

#include <renderweave/display/Renderer.hpp>

#include <cstdint>
#include <optional>

namespace RW::Display {

class Node;

// Chooses the renderer a painted node is drawn with. Returning nullopt means
// no enabled renderer can draw the node.
class RendererPolicy {
public:
    virtual ~RendererPolicy() = default;

    [[nodiscard]] virtual auto choose(Node const& node, std::uint32_t enabled_renderers) const
        -> std::optional<RendererKind> = 0;
};

// Honors the node's preferred renderer when it is both supported and enabled,
// otherwise falls back to Canvas, SVG, WebGL, DOM in that order.
class DefaultRendererPolicy final : public RendererPolicy {
public:
    [[nodiscard]] auto choose(Node const& node, std::uint32_t enabled_renderers) const
        -> std::optional<RendererKind> override;
};

} // namespace RW::Display
