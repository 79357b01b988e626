#pragma once

#include <iosfwd>

namespace tabdock
{
    // a linear RGBA color with floating-point components in [0, 1]
    struct Color final {
        static constexpr Color clear() { return {0.0f, 0.0f, 0.0f, 0.0f}; }
        static constexpr Color black() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
        static constexpr Color white() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
        static constexpr Color dark_grey() { return {0.25f, 0.25f, 0.25f, 1.0f}; }

        constexpr Color() = default;
        constexpr Color(float r_, float g_, float b_, float a_ = 1.0f) :
            r{r_}, g{g_}, b{b_}, a{a_}
        {}

        friend constexpr bool operator==(const Color&, const Color&) = default;

        constexpr Color with_alpha(float a_) const { return {r, g, b, a_}; }

        float r = 0.0f;
        float g = 0.0f;
        float b = 0.0f;
        float a = 1.0f;
    };

    std::ostream& operator<<(std::ostream&, const Color&);
}
