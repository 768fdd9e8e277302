#pragma once

#include <glm/vec2.hpp>

#include <cstddef>

namespace folio { class TabHeader; }
namespace folio { class Widget; }

namespace folio
{
    // the rendering/layout service that a `Notebook` drives
    //
    // implementations are expected to be synchronous and to always succeed. The
    // notebook guarantees that every `TabHeader`/`Widget` it places is forgotten
    // before it is destroyed or removed
    class NotebookRenderer {
    protected:
        NotebookRenderer() = default;
        NotebookRenderer(NotebookRenderer const&) = default;
        NotebookRenderer(NotebookRenderer&&) noexcept = default;
        NotebookRenderer& operator=(NotebookRenderer const&) = default;
        NotebookRenderer& operator=(NotebookRenderer&&) noexcept = default;
    public:
        virtual ~NotebookRenderer() noexcept = default;

        // place (or re-place) the header at the given column of the tab row
        void placeTabHeader(TabHeader& header, size_t column) { implPlaceTabHeader(header, column); }

        // remove the header from the tab row
        void forgetTabHeader(TabHeader const& header) { implForgetTabHeader(header); }

        // restyle the header from its current state (title, active, hovered)
        void updateTabHeader(TabHeader const& header) { implUpdateTabHeader(header); }

        // place the content in the notebook's content region and raise it above any other content
        void raiseContent(Widget& content) { implRaiseContent(content); }

        // remove the content from the notebook's content region
        void forgetContent(Widget const& content) { implForgetContent(content); }

        // show the header's context menu, anchored at the given screen position
        void popupTabMenu(TabHeader& header, glm::vec2 screenPosition) { implPopupTabMenu(header, screenPosition); }

        void focusContent(Widget& content) { implFocusContent(content); }
        void focusNotebook() { implFocusNotebook(); }

    private:
        virtual void implPlaceTabHeader(TabHeader&, size_t) = 0;
        virtual void implForgetTabHeader(TabHeader const&) = 0;
        virtual void implUpdateTabHeader(TabHeader const&) = 0;
        virtual void implRaiseContent(Widget&) = 0;
        virtual void implForgetContent(Widget const&) = 0;
        virtual void implPopupTabMenu(TabHeader&, glm::vec2) = 0;
        virtual void implFocusContent(Widget&) = 0;
        virtual void implFocusNotebook() = 0;
    };
}
