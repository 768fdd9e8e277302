#include <folio/UI/TabGestureBindings.hpp>

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>
#include <folio/Platform/PlatformFamily.hpp>
#include <folio/Platform/PointerEvent.hpp>

#include <gtest/gtest.h>

#include <vector>

using folio::ButtonChord;
using folio::KeyModifier;
using folio::PhysicalMouseButton;
using folio::PlatformFamily;
using folio::PointerEvent;
using folio::TabGestureBindings;

TEST(TabGestureBindings, X11AndWindowsUseButton3ForTheMenuAndButton2ForClosing)
{
    for (PlatformFamily family : {PlatformFamily::X11, PlatformFamily::Windows})
    {
        TabGestureBindings const bindings = TabGestureBindings::forPlatform(family);

        ASSERT_TRUE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button3)));
        ASSERT_FALSE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button2)));
        ASSERT_TRUE(bindings.closesTab(PointerEvent::button_down(PhysicalMouseButton::Button2)));
        ASSERT_FALSE(bindings.closesTab(PointerEvent::button_down(PhysicalMouseButton::Button3)));
    }
}

TEST(TabGestureBindings, MacOSUsesButton2OrCtrlClickForTheMenuAndButton3ForClosing)
{
    TabGestureBindings const bindings = TabGestureBindings::forPlatform(PlatformFamily::MacOS);

    ASSERT_TRUE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button2)));
    ASSERT_TRUE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl)));
    ASSERT_FALSE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button1)));
    ASSERT_TRUE(bindings.closesTab(PointerEvent::button_down(PhysicalMouseButton::Button3)));
    ASSERT_FALSE(bindings.closesTab(PointerEvent::button_down(PhysicalMouseButton::Button2)));
}

TEST(TabGestureBindings, PrimaryClickNeverOpensTheMenuOrClosesOnX11)
{
    TabGestureBindings const bindings = TabGestureBindings::forPlatform(PlatformFamily::X11);
    PointerEvent const e = PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl);

    ASSERT_FALSE(bindings.opensContextMenu(e));
    ASSERT_FALSE(bindings.closesTab(e));
}

TEST(TabGestureBindings, ChordsRequireAllOfTheirModifiersButAllowExtraOnes)
{
    ButtonChord const chord{PhysicalMouseButton::Button1, KeyModifier::Ctrl};

    ASSERT_FALSE(chord.matches(PointerEvent::button_down(PhysicalMouseButton::Button1)));
    ASSERT_TRUE(chord.matches(PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl)));
    ASSERT_TRUE(chord.matches(PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl | KeyModifier::Shift)));
    ASSERT_FALSE(chord.matches(PointerEvent::button_down(PhysicalMouseButton::Button2, KeyModifier::Ctrl)));
}

TEST(TabGestureBindings, ChordsOnlyMatchButtonDownEvents)
{
    ButtonChord const chord{PhysicalMouseButton::None, {}};

    ASSERT_FALSE(chord.matches(PointerEvent::enter()));
    ASSERT_FALSE(chord.matches(PointerEvent::leave()));
}

TEST(TabGestureBindings, CustomBindingsCanBeProvided)
{
    TabGestureBindings const bindings
    {
        std::vector<ButtonChord>{{PhysicalMouseButton::Button4, {}}},
        std::vector<ButtonChord>{{PhysicalMouseButton::Button5, {}}},
    };

    ASSERT_TRUE(bindings.opensContextMenu(PointerEvent::button_down(PhysicalMouseButton::Button4)));
    ASSERT_TRUE(bindings.closesTab(PointerEvent::button_down(PhysicalMouseButton::Button5)));
    ASSERT_EQ(bindings.getContextMenuChords().size(), 1);
}
