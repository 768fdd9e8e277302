#include "TabGestureBindings.hpp"

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>
#include <folio/Platform/PlatformFamily.hpp>
#include <folio/Platform/PointerEvent.hpp>
#include <folio/Utils/Algorithms.hpp>

#include <utility>
#include <vector>

namespace
{
    bool AnyChordMatches(std::vector<folio::ButtonChord> const& chords, folio::PointerEvent const& e)
    {
        return folio::ContainsIf(chords, [&e](folio::ButtonChord const& chord) { return chord.matches(e); });
    }
}

bool folio::ButtonChord::matches(PointerEvent const& e) const
{
    return e.type() == PointerEventType::ButtonDown &&
        e.button() == button &&
        e.modifiers().containsAll(modifiers);
}

folio::TabGestureBindings folio::TabGestureBindings::forPlatform(PlatformFamily family)
{
    if (family == PlatformFamily::MacOS)
    {
        // MacOS: button 2 is the right button, and Ctrl+click is the conventional
        // one-button equivalent of a right click
        return TabGestureBindings
        {
            {ButtonChord{PhysicalMouseButton::Button2, {}}, ButtonChord{PhysicalMouseButton::Button1, KeyModifier::Ctrl}},
            {ButtonChord{PhysicalMouseButton::Button3, {}}},
        };
    }
    else
    {
        return TabGestureBindings
        {
            {ButtonChord{PhysicalMouseButton::Button3, {}}},
            {ButtonChord{PhysicalMouseButton::Button2, {}}},
        };
    }
}

folio::TabGestureBindings::TabGestureBindings(
    std::vector<ButtonChord> contextMenuChords,
    std::vector<ButtonChord> closeChords) :

    m_ContextMenuChords{std::move(contextMenuChords)},
    m_CloseChords{std::move(closeChords)}
{
}

bool folio::TabGestureBindings::opensContextMenu(PointerEvent const& e) const
{
    return AnyChordMatches(m_ContextMenuChords, e);
}

bool folio::TabGestureBindings::closesTab(PointerEvent const& e) const
{
    return AnyChordMatches(m_CloseChords, e);
}
