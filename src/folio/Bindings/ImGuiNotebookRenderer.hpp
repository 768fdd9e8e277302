#pragma once

#include <folio/Platform/PlatformFamily.hpp>
#include <folio/Platform/PointerEvent.hpp>
#include <folio/UI/NotebookRenderer.hpp>
#include <folio/UI/StyleProvider.hpp>
#include <folio/UI/TabHeaderPart.hpp>
#include <folio/UI/TabMenuAction.hpp>
#include <folio/Utils/UID.hpp>

#include <glm/vec2.hpp>

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace folio { class TabHeader; }
namespace folio { class Widget; }

namespace folio
{
    // a `NotebookRenderer` that draws a notebook with Dear ImGui
    //
    // ImGui is an immediate-mode UI, so this keeps a mirror of what the notebook
    // placed (which header is in which column, which content is raised, etc.) and
    // redraws it on each call to `onDraw`. It also acts as the notebook's event
    // source: ImGui clicks/hovers are turned into `PointerEvent`s, which are
    // delivered to the relevant `TabHeader` after all widgets have been submitted
    class ImGuiNotebookRenderer final : public NotebookRenderer {
    public:
        explicit ImGuiNotebookRenderer(
            PlatformFamily = CurrentPlatformFamily(),
            MenuStyle = {}
        );

        // draws the tab row and raised content into the current ImGui window,
        // then delivers any input events that happened while drawing
        void onDraw();

        size_t getNumPlacedTabHeaders() const { return m_Placements.size(); }
        Widget* getRaisedContent() const { return m_RaisedContent; }

    private:
        struct Placement final {
            TabHeader* header;
            size_t column;
        };

        struct HeaderEvent final {
            TabHeaderPart part;
            PointerEvent event;
        };

        // an input that happened on a header, keyed by the header's ID (the
        // header may be destroyed by an earlier event in the same frame)
        struct PendingInput final {
            UID headerID;
            std::variant<HeaderEvent, TabMenuAction> input;
        };

        void implPlaceTabHeader(TabHeader&, size_t) override;
        void implForgetTabHeader(TabHeader const&) override;
        void implUpdateTabHeader(TabHeader const&) override;
        void implRaiseContent(Widget&) override;
        void implForgetContent(Widget const&) override;
        void implPopupTabMenu(TabHeader&, glm::vec2) override;
        void implFocusContent(Widget&) override;
        void implFocusNotebook() override;

        void drawTabRow();
        void drawTabHeader(TabHeader&);
        void queueButtonEvents(TabHeader const&, TabHeaderPart);
        void drawTabMenu();
        void drawContent();
        void dispatchPendingInputs();
        TabHeader* findHeader(UID) const;

        PlatformFamily m_PlatformFamily;
        MenuStyle m_MenuStyle;
        std::vector<Placement> m_Placements;
        Widget* m_RaisedContent = nullptr;
        Widget* m_ContentFocusRequest = nullptr;
        bool m_NotebookFocusRequested = false;
        std::optional<UID> m_PopupRequest;
        UID m_PopupHeader = UID::empty();
        glm::vec2 m_PopupPosition = {};
        std::vector<PendingInput> m_PendingInputs;
    };
}
