#include "PhysicalMouseButton.hpp"

#include <folio/Platform/PlatformFamily.hpp>

folio::PhysicalMouseButton folio::ToPhysicalButton(LogicalMouseButton button, PlatformFamily family)
{
    switch (button)
    {
    case LogicalMouseButton::Left:
        return PhysicalMouseButton::Button1;
    case LogicalMouseButton::Right:
        return family == PlatformFamily::MacOS ? PhysicalMouseButton::Button2 : PhysicalMouseButton::Button3;
    case LogicalMouseButton::Middle:
        return family == PlatformFamily::MacOS ? PhysicalMouseButton::Button3 : PhysicalMouseButton::Button2;
    default:
        return PhysicalMouseButton::None;
    }
}
