#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <type_traits>

namespace tabdock
{
    // stores `OR` combinations of a flag-like `enum class`
    //
    // the enum must have a `None` member equal to zero and store its flags
    // densely as powers of two
    template<typename TEnum>
    requires std::is_enum_v<TEnum>
    class Flags final {
    public:
        using underlying_type = std::underlying_type_t<TEnum>;

        constexpr Flags() = default;
        constexpr Flags(TEnum flag) : value_{static_cast<underlying_type>(flag)} {}
        constexpr Flags(std::initializer_list<TEnum> flags)
        {
            for (TEnum flag : flags) {
                value_ |= static_cast<underlying_type>(flag);
            }
        }

        constexpr bool operator!() const { return value_ == 0; }
        explicit constexpr operator bool () const { return value_ != 0; }

        friend constexpr bool operator==(const Flags&, const Flags&) = default;

        friend constexpr Flags operator&(const Flags& lhs, const Flags& rhs)
        {
            return Flags{static_cast<underlying_type>(lhs.value_ & rhs.value_)};
        }

        friend constexpr Flags operator|(const Flags& lhs, const Flags& rhs)
        {
            return Flags{static_cast<underlying_type>(lhs.value_ | rhs.value_)};
        }

        constexpr Flags& operator|=(const Flags& rhs)
        {
            value_ |= rhs.value_;
            return *this;
        }

        constexpr bool get(TEnum flag) const
        {
            return static_cast<bool>(*this & flag);
        }

        constexpr Flags with(TEnum flag) const
        {
            return Flags{static_cast<underlying_type>(value_ | static_cast<underlying_type>(flag))};
        }

        constexpr Flags without(TEnum flag) const
        {
            return Flags{static_cast<underlying_type>(value_ & ~static_cast<underlying_type>(flag))};
        }

        constexpr underlying_type underlying_value() const { return value_; }

    private:
        explicit constexpr Flags(underlying_type value) : value_{value} {}

        underlying_type value_{};
    };
}

template<typename T>
struct std::hash<tabdock::Flags<T>> final {
    size_t operator()(const tabdock::Flags<T>& flags) const noexcept
    {
        return std::hash<typename tabdock::Flags<T>::underlying_type>{}(flags.underlying_value());
    }
};
