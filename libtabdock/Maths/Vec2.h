#pragma once

#include <iosfwd>

namespace tabdock
{
    // a 2D vector in the UI's coordinate system, in device-independent pixels
    struct Vec2 final {
        constexpr Vec2() = default;
        constexpr Vec2(float x_, float y_) : x{x_}, y{y_} {}
        explicit constexpr Vec2(float v) : x{v}, y{v} {}

        friend constexpr bool operator==(const Vec2&, const Vec2&) = default;

        constexpr Vec2& operator+=(const Vec2& rhs) { x += rhs.x; y += rhs.y; return *this; }
        constexpr Vec2& operator-=(const Vec2& rhs) { x -= rhs.x; y -= rhs.y; return *this; }

        friend constexpr Vec2 operator+(Vec2 lhs, const Vec2& rhs) { return lhs += rhs; }
        friend constexpr Vec2 operator-(Vec2 lhs, const Vec2& rhs) { return lhs -= rhs; }
        friend constexpr Vec2 operator*(float s, const Vec2& v) { return {s * v.x, s * v.y}; }
        friend constexpr Vec2 operator*(const Vec2& v, float s) { return {s * v.x, s * v.y}; }

        float x = 0.0f;
        float y = 0.0f;
    };

    std::ostream& operator<<(std::ostream&, const Vec2&);
}
