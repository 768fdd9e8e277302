#include <folio/UI/TabHeader.hpp>

#include "TestingHelpers.hpp"

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>
#include <folio/Platform/PlatformFamily.hpp>
#include <folio/Platform/PointerEvent.hpp>
#include <folio/UI/CloseIconCache.hpp>
#include <folio/UI/TabGestureBindings.hpp>
#include <folio/UI/TabHeaderHost.hpp>
#include <folio/UI/TabHeaderPart.hpp>
#include <folio/UI/TabMenuAction.hpp>

#include <gtest/gtest.h>
#include <glm/vec2.hpp>

#include <memory>
#include <vector>

using folio::CloseIconCache;
using folio::CountingStyleProvider;
using folio::KeyModifier;
using folio::PhysicalMouseButton;
using folio::PlatformFamily;
using folio::PointerEvent;
using folio::RecordingNotebookRenderer;
using folio::RendererCallType;
using folio::TabGestureBindings;
using folio::TabHeader;
using folio::TabHeaderHost;
using folio::TabHeaderPart;
using folio::TabMenuAction;

namespace
{
    enum class HostRequestType {
        Select,
        Close,
        CloseAll,
    };

    struct HostRequest final {
        HostRequestType type;
        TabHeader const* header;
    };

    // a host that only records what was requested of it
    class RecordingTabHeaderHost final : public TabHeaderHost {
    public:
        std::vector<HostRequest> const& getRequests() const { return m_Requests; }

    private:
        void implRequestSelect(TabHeader const& header) override
        {
            m_Requests.push_back({HostRequestType::Select, &header});
        }

        void implRequestClose(TabHeader const& header) override
        {
            m_Requests.push_back({HostRequestType::Close, &header});
        }

        void implRequestCloseAll(TabHeader const* except) override
        {
            m_Requests.push_back({HostRequestType::CloseAll, except});
        }

        std::vector<HostRequest> m_Requests;
    };

    struct TabHeaderHarness final {
        explicit TabHeaderHarness(PlatformFamily family = PlatformFamily::X11, bool closable = true) :
            header{host, renderer, *closeIcons, TabGestureBindings::forPlatform(family), "title", closable}
        {
        }

        RecordingTabHeaderHost host;
        RecordingNotebookRenderer renderer;
        std::shared_ptr<CountingStyleProvider> styleProvider = std::make_shared<CountingStyleProvider>();
        std::shared_ptr<CloseIconCache> closeIcons = std::make_shared<CloseIconCache>(styleProvider);
        TabHeader header;
    };
}

TEST(TabHeader, InitiallyInactiveAndNotHovered)
{
    TabHeaderHarness h;

    ASSERT_FALSE(h.header.isActive());
    ASSERT_FALSE(h.header.isCloseButtonHovered());
    ASSERT_EQ(h.header.getTitle(), "title");
}

TEST(TabHeader, EachHeaderHasADifferentID)
{
    TabHeaderHarness a;
    TabHeaderHarness b;

    ASSERT_NE(a.header.getID(), b.header.getID());
}

TEST(TabHeader, PrimaryClickOnLabelRequestsSelectionWithoutActivatingItself)
{
    TabHeaderHarness h;

    ASSERT_TRUE(h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button1)));

    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Select);
    ASSERT_EQ(h.host.getRequests().front().header, &h.header);
    ASSERT_FALSE(h.header.isActive());
}

TEST(TabHeader, PrimaryClickOnBodyRequestsSelection)
{
    TabHeaderHarness h;

    h.header.onEvent(TabHeaderPart::Body, PointerEvent::button_down(PhysicalMouseButton::Button1));

    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Select);
}

TEST(TabHeader, SetActiveChangesStateAndRestylesTheHeader)
{
    TabHeaderHarness h;

    h.header.setActive(true);
    ASSERT_TRUE(h.header.isActive());
    h.header.setActive(false);
    ASSERT_FALSE(h.header.isActive());

    ASSERT_EQ(h.renderer.countCalls(RendererCallType::UpdateTabHeader), 2);
}

TEST(TabHeader, SetTitleChangesTitleAndRestylesTheHeader)
{
    TabHeaderHarness h;

    h.header.setTitle("renamed");

    ASSERT_EQ(h.header.getTitle(), "renamed");
    ASSERT_EQ(h.renderer.countCalls(RendererCallType::UpdateTabHeader), 1);
}

TEST(TabHeader, ClickOnCloseButtonRequestsClose)
{
    TabHeaderHarness h;

    ASSERT_TRUE(h.header.onEvent(TabHeaderPart::CloseButton, PointerEvent::button_down(PhysicalMouseButton::Button1)));

    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Close);
}

TEST(TabHeader, HoveringTheCloseButtonSwapsTheCloseIcon)
{
    TabHeaderHarness h;

    folio::Icon const* idle = h.header.getCloseIcon();
    ASSERT_NE(idle, nullptr);
    ASSERT_EQ(idle->getName(), "tab-close");

    h.header.onEvent(TabHeaderPart::CloseButton, PointerEvent::enter());
    ASSERT_TRUE(h.header.isCloseButtonHovered());
    ASSERT_EQ(h.header.getCloseIcon()->getName(), "tab-close-active");

    h.header.onEvent(TabHeaderPart::CloseButton, PointerEvent::leave());
    ASSERT_FALSE(h.header.isCloseButtonHovered());
    ASSERT_EQ(h.header.getCloseIcon(), idle);

    ASSERT_TRUE(h.host.getRequests().empty());
    ASSERT_EQ(h.renderer.countCalls(RendererCallType::UpdateTabHeader), 2);
}

TEST(TabHeader, EnterAndLeaveOnTheLabelAreIgnored)
{
    TabHeaderHarness h;

    ASSERT_FALSE(h.header.onEvent(TabHeaderPart::Label, PointerEvent::enter()));
    ASSERT_FALSE(h.header.onEvent(TabHeaderPart::Label, PointerEvent::leave()));
    ASSERT_FALSE(h.header.isCloseButtonHovered());
}

TEST(TabHeader, SecondaryButtonOpensContextMenuOnX11)
{
    TabHeaderHarness h{PlatformFamily::X11};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button3, {}, glm::vec2{5.0f, 7.0f}));

    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 1);
    ASSERT_EQ(h.renderer.getCalls().back().position, glm::vec2(5.0f, 7.0f));
    ASSERT_TRUE(h.host.getRequests().empty());
}

TEST(TabHeader, TertiaryButtonClosesTabOnX11)
{
    TabHeaderHarness h{PlatformFamily::X11};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button2));

    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Close);
    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 0);
}

TEST(TabHeader, ButtonBindingsAreSwappedOnMacOS)
{
    TabHeaderHarness h{PlatformFamily::MacOS};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button2));
    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 1);
    ASSERT_TRUE(h.host.getRequests().empty());

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button3));
    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Close);
}

TEST(TabHeader, CtrlClickOpensContextMenuOnMacOS)
{
    TabHeaderHarness h{PlatformFamily::MacOS};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl));

    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 1);
    ASSERT_TRUE(h.host.getRequests().empty());
}

TEST(TabHeader, CtrlClickSelectsOnX11)
{
    TabHeaderHarness h{PlatformFamily::X11};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl));

    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 0);
    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Select);
}

TEST(TabHeader, CtrlClickOnANonClosableTabSelectsItOnMacOS)
{
    TabHeaderHarness h{PlatformFamily::MacOS, false};

    h.header.onEvent(TabHeaderPart::Label, PointerEvent::button_down(PhysicalMouseButton::Button1, KeyModifier::Ctrl));

    ASSERT_EQ(h.renderer.countCalls(RendererCallType::PopupTabMenu), 0);
    ASSERT_EQ(h.host.getRequests().size(), 1);
    ASSERT_EQ(h.host.getRequests().front().type, HostRequestType::Select);
}

TEST(TabHeader, NonClosableHeaderHasNoCloseIconAndDoesNotLoadIcons)
{
    TabHeaderHarness h{PlatformFamily::X11, false};

    ASSERT_EQ(h.header.getCloseIcon(), nullptr);
    ASSERT_FALSE(h.closeIcons->isLoaded());
    ASSERT_EQ(h.styleProvider->getNumLoads(), 0);
}

TEST(TabHeader, MenuItemsDelegateToTheHost)
{
    TabHeaderHarness h;

    h.header.activateMenuItem(TabMenuAction::Close);
    h.header.activateMenuItem(TabMenuAction::CloseOthers);
    h.header.activateMenuItem(TabMenuAction::CloseAll);

    auto const& requests = h.host.getRequests();
    ASSERT_EQ(requests.size(), 3);
    ASSERT_EQ(requests[0].type, HostRequestType::Close);
    ASSERT_EQ(requests[0].header, &h.header);
    ASSERT_EQ(requests[1].type, HostRequestType::CloseAll);
    ASSERT_EQ(requests[1].header, &h.header);
    ASSERT_EQ(requests[2].type, HostRequestType::CloseAll);
    ASSERT_EQ(requests[2].header, nullptr);
}

TEST(TabHeader, MenuActionLabelsAreInMenuOrder)
{
    ASSERT_EQ(folio::c_TabMenuActions.size(), 3);
    ASSERT_EQ(folio::GetTabMenuActionLabel(folio::c_TabMenuActions[0]), "Close");
    ASSERT_EQ(folio::GetTabMenuActionLabel(folio::c_TabMenuActions[1]), "Close others");
    ASSERT_EQ(folio::GetTabMenuActionLabel(folio::c_TabMenuActions[2]), "Close all");
}
