#pragma once

#include <folio/Platform/PointerEvent.hpp>
#include <folio/UI/Icon.hpp>
#include <folio/UI/TabGestureBindings.hpp>
#include <folio/UI/TabHeaderPart.hpp>
#include <folio/UI/TabMenuAction.hpp>
#include <folio/Utils/CStringView.hpp>
#include <folio/Utils/UID.hpp>

#include <string>
#include <string_view>

namespace folio { class CloseIconCache; }
namespace folio { class NotebookRenderer; }
namespace folio { class TabHeaderHost; }

namespace folio
{
    // the clickable strip that represents one page in a notebook's tab row
    //
    // a tab header translates pointer events into requests to its host (select
    // this tab, close this tab, close other tabs, etc.). It never changes its
    // own active state: the host calls `setActive` once a selection switch has
    // actually happened
    class TabHeader final {
    public:
        TabHeader(
            TabHeaderHost&,
            NotebookRenderer&,
            CloseIconCache&,
            TabGestureBindings,
            std::string_view title,
            bool closable
        );
        TabHeader(TabHeader const&) = delete;
        TabHeader(TabHeader&&) noexcept = delete;
        TabHeader& operator=(TabHeader const&) = delete;
        TabHeader& operator=(TabHeader&&) noexcept = delete;
        ~TabHeader() noexcept;

        UID getID() const { return m_ID; }

        CStringView getTitle() const { return m_Title; }
        void setTitle(std::string_view);

        bool isClosable() const { return m_Closable; }
        bool isActive() const { return m_Active; }
        bool isCloseButtonHovered() const { return m_CloseButtonHovered; }

        // returns the icon the close button should currently show, or `nullptr`
        // if the tab isn't closable
        Icon const* getCloseIcon() const;

        // called by the host when the tab becomes (in)active
        void setActive(bool);

        // delivers a pointer event that happened on `part` of this header
        //
        // returns `true` if the event was handled. Care: handling an event may
        // cause the host to destroy this header
        bool onEvent(TabHeaderPart part, PointerEvent const&);

        // called when the user picks an item from this header's context menu
        //
        // care: may cause the host to destroy this header
        void activateMenuItem(TabMenuAction);

    private:
        bool onBodyEvent(PointerEvent const&);
        bool onCloseButtonEvent(PointerEvent const&);

        UID m_ID;
        TabHeaderHost* m_Host;
        NotebookRenderer* m_Renderer;
        CloseIconCache* m_CloseIcons;
        TabGestureBindings m_Bindings;
        std::string m_Title;
        bool m_Closable;
        bool m_Active = false;
        bool m_CloseButtonHovered = false;
    };
}
