#pragma once

#include <folio/Utils/UID.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace folio { class Widget; }

namespace folio
{
    // tag type that denotes "one past the last tab" (i.e. append)
    struct EndOfTabs final {
        friend constexpr bool operator==(EndOfTabs, EndOfTabs) = default;
    };
    inline constexpr EndOfTabs c_EndOfTabs{};

    // identifies a tab in a notebook
    using TabID = UID;

    // describes how to find a tab in a notebook
    //
    // - `EndOfTabs`: always resolves to the number of tabs
    // - `TabID`: the identifier the notebook assigned when the tab was inserted
    // - `Widget`: the content's identity (address), the canonical key
    // - name string: convenience alias that matches the first tab whose content
    //   has the given name
    class TabLocator final {
    public:
        TabLocator(EndOfTabs) : m_Value{EndOfTabs{}} {}
        TabLocator(TabID id) : m_Value{id} {}
        TabLocator(Widget const& content) : m_Value{&content} {}
        TabLocator(char const* name) : m_Value{std::string{name}} {}
        TabLocator(std::string_view name) : m_Value{std::string{name}} {}
        TabLocator(std::string const& name) : m_Value{name} {}

        template<typename Visitor>
        decltype(auto) visit(Visitor&& visitor) const
        {
            return std::visit(std::forward<Visitor>(visitor), m_Value);
        }

        bool isEnd() const { return std::holds_alternative<EndOfTabs>(m_Value); }

        // returns a human-readable description (handy for error messages)
        std::string toString() const;

    private:
        std::variant<EndOfTabs, TabID, Widget const*, std::string> m_Value;
    };
}
