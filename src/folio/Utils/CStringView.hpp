#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace folio
{
    // represents a view into a NUL-terminated C string
    class CStringView final {
    public:
        constexpr CStringView() noexcept : m_Data{""}, m_Size{0} {}
        constexpr CStringView(CStringView const&) noexcept = default;
        constexpr CStringView& operator=(CStringView const&) noexcept = default;
        constexpr CStringView(char const* s) : m_Data{s}, m_Size{std::char_traits<char>::length(s)} {}
        CStringView(std::string const& s) : m_Data{s.c_str()}, m_Size{s.size()} {}
        constexpr CStringView(std::nullptr_t) = delete;

        constexpr std::size_t size() const noexcept { return m_Size; }
        constexpr std::size_t length() const noexcept { return m_Size; }
        constexpr bool empty() const noexcept { return m_Size == 0; }
        constexpr char const* c_str() const noexcept { return m_Data; }
        constexpr operator std::string_view () const noexcept { return std::string_view{m_Data, m_Size}; }

        friend constexpr bool operator==(CStringView const& lhs, CStringView const& rhs) noexcept
        {
            return std::string_view{lhs} == std::string_view{rhs};
        }

    private:
        char const* m_Data;
        std::size_t m_Size;
    };

    inline std::string to_string(CStringView const& sv)
    {
        return std::string{sv};
    }

    std::ostream& operator<<(std::ostream&, CStringView const&);

    inline std::string operator+(std::string const& s, CStringView const& sv)
    {
        return s + to_string(sv);
    }
}

namespace std
{
    template<>
    struct hash<folio::CStringView> {
        std::size_t operator()(folio::CStringView const& sv) const
        {
            return std::hash<std::string_view>{}(sv);
        }
    };
}
