#pragma once

#include <folio/Utils/CStringView.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace folio
{
    // the family of windowing systems the UI is running on
    //
    // families differ in input conventions (e.g. which physical mouse button
    // is the "secondary" one), so UI code looks conventions up by family,
    // rather than branching on the toolkit/OS inline
    enum class PlatformFamily {
        Windows,
        MacOS,
        X11,
        NUM_OPTIONS,
    };

    // returns the family that this binary was compiled for
    PlatformFamily CurrentPlatformFamily() noexcept;

    CStringView GetPlatformFamilyName(PlatformFamily);

    // parses the output of `GetPlatformFamilyName` (e.g. "macos")
    std::optional<PlatformFamily> TryParsePlatformFamily(std::string_view);
}
