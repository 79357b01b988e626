#pragma once

#include <libtabdock/Maths/Vec2.h>

#include <algorithm>
#include <iosfwd>

namespace tabdock
{
    // a 2D axis-aligned rectangle in the UI coordinate system (X points right,
    // Y points down)
    class Rect final {
    public:
        // Returns a `Rect` that spans the two given corner points, in any order.
        static constexpr Rect from_corners(const Vec2& p1, const Vec2& p2)
        {
            return Rect{
                Vec2{std::min(p1.x, p2.x), std::min(p1.y, p2.y)},
                Vec2{std::max(p1.x, p2.x), std::max(p1.y, p2.y)},
            };
        }

        // Returns a `Rect` with its top-left corner at `top_left` and the given dimensions.
        static constexpr Rect from_top_left_and_dimensions(const Vec2& top_left, const Vec2& dimensions)
        {
            return from_corners(top_left, top_left + dimensions);
        }

        constexpr Rect() = default;

        friend constexpr bool operator==(const Rect&, const Rect&) = default;

        constexpr Vec2 min_corner() const { return min_; }
        constexpr Vec2 max_corner() const { return max_; }
        constexpr Vec2 origin() const { return 0.5f*(min_ + max_); }
        constexpr Vec2 dimensions() const { return max_ - min_; }
        constexpr float width() const { return max_.x - min_.x; }
        constexpr float height() const { return max_.y - min_.y; }
        constexpr float area() const { return width() * height(); }

        constexpr bool contains(const Vec2& p) const
        {
            return min_.x <= p.x and p.x <= max_.x and min_.y <= p.y and p.y <= max_.y;
        }

    private:
        constexpr Rect(const Vec2& min, const Vec2& max) : min_{min}, max_{max} {}

        Vec2 min_{};
        Vec2 max_{};
    };

    std::ostream& operator<<(std::ostream&, const Rect&);
}
