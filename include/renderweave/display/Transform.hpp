#pragma once

#include <array>
#include <cmath>

namespace RW::Display {

// 2D affine transform stored row-major as
//   | a c e |
//   | b d f |
//   | 0 0 1 |
struct Transform {
    std::array<float, 6> elements{1.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f};

    [[nodiscard]] static auto identity() -> Transform {
        return Transform{};
    }

    [[nodiscard]] static auto translation(float x, float y) -> Transform {
        return Transform{{1.0f, 0.0f, 0.0f, 1.0f, x, y}};
    }

    [[nodiscard]] static auto scaling(float sx, float sy) -> Transform {
        return Transform{{sx, 0.0f, 0.0f, sy, 0.0f, 0.0f}};
    }

    [[nodiscard]] static auto rotation(float radians) -> Transform {
        auto const c = std::cos(radians);
        auto const s = std::sin(radians);
        return Transform{{c, s, -s, c, 0.0f, 0.0f}};
    }

    // this * rhs: rhs is applied first.
    [[nodiscard]] auto multiply(Transform const& rhs) const -> Transform {
        auto const& l = elements;
        auto const& r = rhs.elements;
        return Transform{{
            l[0] * r[0] + l[2] * r[1],
            l[1] * r[0] + l[3] * r[1],
            l[0] * r[2] + l[2] * r[3],
            l[1] * r[2] + l[3] * r[3],
            l[0] * r[4] + l[2] * r[5] + l[4],
            l[1] * r[4] + l[3] * r[5] + l[5],
        }};
    }

    [[nodiscard]] auto is_identity() const -> bool {
        return *this == Transform{};
    }

    friend bool operator==(Transform const&, Transform const&) = default;
};

} // namespace RW::Display
