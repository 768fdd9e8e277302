#pragma once

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>
#include <folio/Platform/PlatformFamily.hpp>
#include <folio/Platform/PointerEvent.hpp>

#include <vector>

namespace folio
{
    // a physical mouse button, pressed while (at least) the given modifiers are held
    struct ButtonChord final {
        PhysicalMouseButton button = PhysicalMouseButton::None;
        KeyModifiers modifiers;

        bool matches(PointerEvent const&) const;

        friend bool operator==(ButtonChord const&, ButtonChord const&) = default;
    };

    // which pointer gestures trigger which tab-level actions
    //
    // platform families use different buttons for the "secondary" (context menu)
    // and "tertiary" (close) gestures, so these are looked up once per family
    // and handed to each tab header
    class TabGestureBindings final {
    public:
        static TabGestureBindings forPlatform(PlatformFamily);

        TabGestureBindings(
            std::vector<ButtonChord> contextMenuChords,
            std::vector<ButtonChord> closeChords
        );

        std::vector<ButtonChord> const& getContextMenuChords() const { return m_ContextMenuChords; }
        std::vector<ButtonChord> const& getCloseChords() const { return m_CloseChords; }

        bool opensContextMenu(PointerEvent const&) const;
        bool closesTab(PointerEvent const&) const;

    private:
        std::vector<ButtonChord> m_ContextMenuChords;
        std::vector<ButtonChord> m_CloseChords;
    };
}
