#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string_view>

namespace tabdock
{
    // a value that identifies a tab within a `DockArea` across frames
    //
    // the default identity of a tab is derived from its title, so two tabs
    // with the same title (and no custom `TabViewer::id`) have equal ids
    class TabId final {
    public:
        static TabId from_title(std::string_view title)
        {
            return TabId{std::hash<std::string_view>{}(title)};
        }

        constexpr TabId() = default;
        explicit constexpr TabId(size_t value) : value_{value} {}

        constexpr size_t value() const { return value_; }

        friend constexpr bool operator==(const TabId&, const TabId&) = default;

        friend std::ostream& operator<<(std::ostream& o, const TabId& id)
        {
            return o << "TabId(" << id.value_ << ')';
        }
    private:
        size_t value_ = 0;
    };
}

template<>
struct std::hash<tabdock::TabId> final {
    size_t operator()(const tabdock::TabId& id) const noexcept
    {
        return id.value();
    }
};
