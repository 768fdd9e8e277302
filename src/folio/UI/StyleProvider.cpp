#include "StyleProvider.hpp"

#include <folio/UI/Icon.hpp>
#include <folio/Utils/CStringView.hpp>

#include <array>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace
{
    struct BuiltinIcon final {
        std::string_view name;
        std::string_view glyph;
    };

    constexpr std::array<BuiltinIcon, 2> c_BuiltinIcons =
    {{
        {"tab-close", "x"},
        {"tab-close-active", "X"},
    }};
}

folio::Icon folio::BuiltinStyleProvider::implLoadIcon(CStringView name)
{
    for (BuiltinIcon const& icon : c_BuiltinIcons)
    {
        if (icon.name == std::string_view{name})
        {
            return Icon{icon.name, icon.glyph};
        }
    }

    std::stringstream ss;
    ss << "error loading icon: cannot find a built-in icon called: " << name;
    throw std::runtime_error{std::move(ss).str()};
}
