#include "PlatformFamily.hpp"

#include <folio/Utils/CStringView.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace
{
    constexpr std::array<folio::CStringView, static_cast<size_t>(folio::PlatformFamily::NUM_OPTIONS)> c_PlatformFamilyNames =
    {
        "windows",
        "macos",
        "x11",
    };
}

folio::PlatformFamily folio::CurrentPlatformFamily() noexcept
{
#if defined(_WIN32)
    return PlatformFamily::Windows;
#elif defined(__APPLE__)
    return PlatformFamily::MacOS;
#else
    return PlatformFamily::X11;
#endif
}

folio::CStringView folio::GetPlatformFamilyName(PlatformFamily family)
{
    return c_PlatformFamilyNames.at(static_cast<size_t>(family));
}

std::optional<folio::PlatformFamily> folio::TryParsePlatformFamily(std::string_view s)
{
    for (size_t i = 0; i < c_PlatformFamilyNames.size(); ++i)
    {
        if (std::string_view{c_PlatformFamilyNames[i]} == s)
        {
            return static_cast<PlatformFamily>(i);
        }
    }
    return std::nullopt;
}
