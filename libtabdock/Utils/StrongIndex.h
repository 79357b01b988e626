#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>

namespace tabdock
{
    // an index that is tagged with a type, so that (e.g.) a surface index
    // can't be accidentally passed where a node index is expected
    template<typename Tag>
    class StrongIndex final {
    public:
        constexpr StrongIndex() = default;
        explicit constexpr StrongIndex(size_t value) : value_{value} {}

        constexpr size_t get() const { return value_; }

        friend constexpr auto operator<=>(const StrongIndex&, const StrongIndex&) = default;

        friend std::ostream& operator<<(std::ostream& o, const StrongIndex& index)
        {
            return o << index.value_;
        }
    private:
        size_t value_ = 0;
    };
}

template<typename Tag>
struct std::hash<tabdock::StrongIndex<Tag>> final {
    size_t operator()(const tabdock::StrongIndex<Tag>& index) const noexcept
    {
        return std::hash<size_t>{}(index.get());
    }
};
