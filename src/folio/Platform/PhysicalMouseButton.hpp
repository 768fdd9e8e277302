#pragma once

#include <folio/Platform/PlatformFamily.hpp>

namespace folio
{
    // a mouse button, as numbered by the windowing system
    //
    // the numbering is platform-dependent: e.g. on X11 the right button is
    // `Button3`, whereas on MacOS it's `Button2`
    enum class PhysicalMouseButton {
        None = 0,
        Button1,
        Button2,
        Button3,
        Button4,
        Button5,
    };

    // a mouse button, as named by most UI toolkits
    enum class LogicalMouseButton {
        Left,
        Right,
        Middle,
    };

    // maps a toolkit-level button onto the windowing system's numbering for `family`
    PhysicalMouseButton ToPhysicalButton(LogicalMouseButton, PlatformFamily);
}
