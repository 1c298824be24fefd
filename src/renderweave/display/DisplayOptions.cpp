#include <renderweave/display/DisplayOptions.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace RW::Display {

namespace {

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n';
}

auto lowercase(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

auto apply_flag(char const* name, bool& field) -> void {
    if (auto value = parse_truthy(std::getenv(name))) {
        field = *value;
    }
}

} // namespace

auto parse_truthy(char const* value) -> std::optional<bool> {
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string_view text{value};
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    auto const normalized = lowercase(text);
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto parse_renderer_list(std::string_view text) -> std::optional<std::uint32_t> {
    std::uint32_t mask = Renderer::None;
    while (!text.empty()) {
        auto const end = text.find_first_of(", \t");
        auto const token = text.substr(0, end);
        if (!token.empty()) {
            auto const name = lowercase(token);
            if (name == "all") {
                mask |= Renderer::All;
            } else if (auto kind = renderer_from_name(name)) {
                mask |= Renderer::bit(*kind);
            }
        }
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }
    if (mask == Renderer::None) {
        return std::nullopt;
    }
    return mask;
}

auto DisplayOptions::from_environment() -> DisplayOptions {
    DisplayOptions options;
    if (auto const* renderers = std::getenv("RENDERWEAVE_RENDERERS")) {
        if (auto mask = parse_renderer_list(renderers)) {
            options.enabled_renderers = *mask;
        }
    }
    apply_flag("RENDERWEAVE_STRICT_CONSISTENCY", options.strict_consistency);
    apply_flag("RENDERWEAVE_GREEDY", options.greedy_enabled);
    apply_flag("RENDERWEAVE_GREEDY_SWAP", options.greedy_allow_adjacent_swap);
    apply_flag("RENDERWEAVE_WEBGL_FULL_DISPLAY", options.webgl_full_display);
    apply_flag("RENDERWEAVE_AUDIT", options.audit_after_frame);
    return options;
}

} // namespace RW::Display
