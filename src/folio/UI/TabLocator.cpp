#include "TabLocator.hpp"

#include <folio/UI/Widget.hpp>

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

std::string folio::TabLocator::toString() const
{
    std::stringstream ss;
    visit([&ss](auto const& v)
    {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, EndOfTabs>)
        {
            ss << "end";
        }
        else if constexpr (std::is_same_v<T, TabID>)
        {
            ss << "tab #" << v;
        }
        else if constexpr (std::is_same_v<T, Widget const*>)
        {
            ss << "widget '" << v->getName() << "' (#" << v->getID() << ')';
        }
        else
        {
            ss << "name '" << v << '\'';
        }
    });
    return std::move(ss).str();
}
