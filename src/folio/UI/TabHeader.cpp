#include "TabHeader.hpp"

#include <folio/Platform/Log.hpp>
#include <folio/Platform/PointerEvent.hpp>
#include <folio/UI/CloseIconCache.hpp>
#include <folio/UI/NotebookRenderer.hpp>
#include <folio/UI/TabHeaderHost.hpp>

#include <string_view>
#include <utility>

folio::TabHeader::TabHeader(
    TabHeaderHost& host,
    NotebookRenderer& renderer,
    CloseIconCache& closeIcons,
    TabGestureBindings bindings,
    std::string_view title,
    bool closable) :

    m_Host{&host},
    m_Renderer{&renderer},
    m_CloseIcons{&closeIcons},
    m_Bindings{std::move(bindings)},
    m_Title{title},
    m_Closable{closable}
{
    if (m_Closable)
    {
        // the first closable tab triggers loading the (shared) close icons
        m_CloseIcons->getIcon(CloseIconVariant::Idle);
    }
}

folio::TabHeader::~TabHeader() noexcept = default;

void folio::TabHeader::setTitle(std::string_view title)
{
    m_Title = title;
    m_Renderer->updateTabHeader(*this);
}

folio::Icon const* folio::TabHeader::getCloseIcon() const
{
    if (!m_Closable)
    {
        return nullptr;
    }
    return &m_CloseIcons->getIcon(m_CloseButtonHovered ? CloseIconVariant::Hovered : CloseIconVariant::Idle);
}

void folio::TabHeader::setActive(bool active)
{
    m_Active = active;
    m_Renderer->updateTabHeader(*this);
}

bool folio::TabHeader::onEvent(TabHeaderPart part, PointerEvent const& e)
{
    if (part == TabHeaderPart::CloseButton)
    {
        return onCloseButtonEvent(e);
    }
    else
    {
        return onBodyEvent(e);
    }
}

void folio::TabHeader::activateMenuItem(TabMenuAction action)
{
    log::debug("%s: context menu: %s", m_Title.c_str(), GetTabMenuActionLabel(action).c_str());

    switch (action)
    {
    case TabMenuAction::Close:
        m_Host->requestClose(*this);
        break;
    case TabMenuAction::CloseOthers:
        m_Host->requestCloseAll(this);
        break;
    case TabMenuAction::CloseAll:
        m_Host->requestCloseAll(nullptr);
        break;
    }
}

bool folio::TabHeader::onBodyEvent(PointerEvent const& e)
{
    if (e.type() != PointerEventType::ButtonDown)
    {
        return false;
    }

    // the menu/close gestures are only bound on closable tabs
    if (m_Closable && m_Bindings.opensContextMenu(e))
    {
        m_Renderer->popupTabMenu(*this, e.location());
        return true;
    }
    else if (m_Closable && m_Bindings.closesTab(e))
    {
        m_Host->requestClose(*this);
        return true;
    }
    else if (e.button() == PhysicalMouseButton::Button1)
    {
        m_Host->requestSelect(*this);
        return true;
    }
    else
    {
        return false;
    }
}

bool folio::TabHeader::onCloseButtonEvent(PointerEvent const& e)
{
    if (!m_Closable)
    {
        return false;
    }

    switch (e.type())
    {
    case PointerEventType::ButtonDown:
        if (e.button() == PhysicalMouseButton::Button1)
        {
            m_Host->requestClose(*this);
            return true;
        }
        return false;
    case PointerEventType::Enter:
        m_CloseButtonHovered = true;
        m_Renderer->updateTabHeader(*this);
        return true;
    case PointerEventType::Leave:
        m_CloseButtonHovered = false;
        m_Renderer->updateTabHeader(*this);
        return true;
    default:
        return false;
    }
}
