#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace tabdock
{
    // a readonly view of a NUL-terminated string
    //
    // lets callers pass a `std::string` or literal into APIs that ultimately
    // need a `const char*` (e.g. ImGui) without copying
    class CStringView final {
    public:
        constexpr CStringView() = default;
        constexpr CStringView(const char* s) :
            data_{s ? s : ""},
            size_{std::char_traits<char>::length(data_)}
        {}
        constexpr CStringView(std::nullptr_t) = delete;
        CStringView(const std::string& s) :
            data_{s.c_str()},
            size_{s.size()}
        {}

        constexpr size_t size() const { return size_; }
        constexpr bool empty() const { return size_ == 0; }
        constexpr const char* c_str() const { return data_; }
        constexpr operator std::string_view () const { return std::string_view{data_, size_}; }

        friend constexpr bool operator==(const CStringView& lhs, const CStringView& rhs)
        {
            return std::string_view{lhs} == std::string_view{rhs};
        }

    private:
        const char* data_ = "";
        size_t size_ = 0;
    };

    inline std::string to_string(const CStringView& sv)
    {
        return std::string{sv};
    }

    std::ostream& operator<<(std::ostream&, const CStringView&);
    std::string operator+(const char*, const CStringView&);
    std::string operator+(const std::string&, const CStringView&);
}

template<>
struct std::hash<tabdock::CStringView> final {
    size_t operator()(const tabdock::CStringView& sv) const
    {
        return std::hash<std::string_view>{}(sv);
    }
};
