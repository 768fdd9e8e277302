#pragma once

#include <cstdint>

namespace folio
{
    enum class KeyModifier : uint8_t {
        None  = 0,
        Shift = 1<<0,
        Ctrl  = 1<<1,
        Alt   = 1<<2,
        Meta  = 1<<3,
    };

    // an `OR`ed combination of `KeyModifier`s
    class KeyModifiers final {
    public:
        constexpr KeyModifiers() = default;
        constexpr KeyModifiers(KeyModifier m) : m_Value{static_cast<uint8_t>(m)} {}

        constexpr bool contains(KeyModifier m) const
        {
            return (m_Value & static_cast<uint8_t>(m)) == static_cast<uint8_t>(m);
        }

        constexpr bool containsAll(KeyModifiers other) const
        {
            return (m_Value & other.m_Value) == other.m_Value;
        }

        constexpr KeyModifiers with(KeyModifier m) const
        {
            KeyModifiers rv = *this;
            rv.m_Value |= static_cast<uint8_t>(m);
            return rv;
        }

        friend constexpr bool operator==(KeyModifiers const&, KeyModifiers const&) = default;

    private:
        uint8_t m_Value = 0;
    };

    constexpr KeyModifiers operator|(KeyModifiers lhs, KeyModifier rhs)
    {
        return lhs.with(rhs);
    }

    constexpr KeyModifiers operator|(KeyModifier lhs, KeyModifier rhs)
    {
        return KeyModifiers{lhs}.with(rhs);
    }
}
