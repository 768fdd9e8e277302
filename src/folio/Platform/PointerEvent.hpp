#pragma once

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>

#include <glm/vec2.hpp>

namespace folio
{
    enum class PointerEventType {
        ButtonDown,
        Enter,
        Leave,
    };

    // represents a pointer (mouse) event that was delivered to a control
    class PointerEvent final {
    public:
        static PointerEvent button_down(
            PhysicalMouseButton button,
            KeyModifiers modifiers = {},
            glm::vec2 screenPosition = {})
        {
            return PointerEvent{PointerEventType::ButtonDown, button, modifiers, screenPosition};
        }

        static PointerEvent enter()
        {
            return PointerEvent{PointerEventType::Enter, PhysicalMouseButton::None, {}, {}};
        }

        static PointerEvent leave()
        {
            return PointerEvent{PointerEventType::Leave, PhysicalMouseButton::None, {}, {}};
        }

        PointerEventType type() const { return m_Type; }
        PhysicalMouseButton button() const { return m_Button; }
        KeyModifiers modifiers() const { return m_Modifiers; }

        // returns the location of the pointer in screen space when the event happened
        glm::vec2 location() const { return m_Location; }

    private:
        PointerEvent(
            PointerEventType type,
            PhysicalMouseButton button,
            KeyModifiers modifiers,
            glm::vec2 location) :

            m_Type{type},
            m_Button{button},
            m_Modifiers{modifiers},
            m_Location{location}
        {}

        PointerEventType m_Type;
        PhysicalMouseButton m_Button;
        KeyModifiers m_Modifiers;
        glm::vec2 m_Location;
    };
}
