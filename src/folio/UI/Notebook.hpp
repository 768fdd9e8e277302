#pragma once

#include <folio/UI/TabGestureBindings.hpp>
#include <folio/UI/TabHeaderHost.hpp>
#include <folio/UI/TabLocator.hpp>
#include <folio/Utils/CStringView.hpp>
#include <folio/Utils/UID.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace folio { class CloseIconCache; }
namespace folio { class NotebookRenderer; }
namespace folio { class TabHeader; }
namespace folio { class Widget; }

namespace folio
{
    // a tabbed container: a row of selectable tabs, each owning one content page
    //
    // - the notebook owns each page's `TabHeader`, but not its content `Widget`:
    //   callers must keep the content alive while it's a page of the notebook
    // - at most one page is current. There is always a current page, unless
    //   the notebook is empty
    // - every operation either fully applies or throws without changing anything
    class Notebook final : private TabHeaderHost {
    public:
        Notebook(
            NotebookRenderer&,
            std::shared_ptr<CloseIconCache>,
            TabGestureBindings,
            bool closable = true
        );
        Notebook(Notebook const&) = delete;
        Notebook(Notebook&&) noexcept = delete;
        Notebook& operator=(Notebook const&) = delete;
        Notebook& operator=(Notebook&&) noexcept = delete;
        ~Notebook() noexcept override;

        bool isClosable() const { return m_Closable; }
        size_t size() const;
        bool empty() const;

        // appends a page and selects it
        TabID add(Widget& content, std::string_view title);

        // inserts a page at `pos` (shifting later pages right) and selects it
        //
        // throws `TabIndexError` if `pos` is greater than `size()`
        TabID insert(size_t pos, Widget& content, std::string_view title);
        TabID insert(EndOfTabs, Widget& content, std::string_view title);

        // removes the page that holds `content`
        //
        // if it was the current page, the page that takes its index (or, if it
        // was the last page, the new last page) becomes current
        void forget(Widget const& content);

        // returns the identifier of the current page, if any
        std::optional<TabID> select() const;

        // resolves the locator and then selects that page
        void select(TabLocator const&);

        // does nothing if `index` is already the current page
        void selectByIndex(size_t index);

        void selectTab(TabHeader const&);

        // returns the index of the located page (`size()` for `EndOfTabs`)
        size_t index(TabLocator const&) const;

        // renames the located page's tab
        void setTabTitle(TabLocator const&, std::string_view title);
        CStringView getTabTitle(TabLocator const&) const;

        // returns the identifiers of all pages, in display order
        std::vector<TabID> tabs() const;

        // returns the content of all pages, in display order
        std::vector<Widget*> getChildren() const;

        Widget& getChildByIndex(size_t index) const;
        Widget* getCurrentChild() const;
        std::optional<size_t> getCurrentIndex() const;

        TabHeader& updTabHeaderByIndex(size_t index);

        // closes the page that `header` belongs to
        void closeTab(TabHeader const& header);

        // closes every page (except `except`, if provided), last page first
        void closeTabs(TabHeader const* except = nullptr);

        // moves input focus to the current page's content, or to the notebook
        // itself if there are no pages
        void focus();

        // registers a callback that's called once per switch of the current page
        UID addSelectionChangedListener(std::function<void()>);
        bool removeSelectionChangedListener(UID);

    private:
        struct Page;

        void implRequestSelect(TabHeader const&) override;
        void implRequestClose(TabHeader const&) override;
        void implRequestCloseAll(TabHeader const*) override;

        std::optional<size_t> tryIndexOf(TabLocator const&) const;
        std::optional<size_t> tryIndexOfHeader(TabHeader const&) const;
        Page& getPageOrThrow(size_t index);
        Page const& getPageOrThrow(size_t index) const;
        void rearrangeTabs();
        void emitSelectionChanged();

        struct SelectionChangedListener final {
            UID id;
            std::function<void()> callback;
        };

        NotebookRenderer* m_Renderer;
        std::shared_ptr<CloseIconCache> m_CloseIcons;
        TabGestureBindings m_Bindings;
        bool m_Closable;
        std::vector<Page> m_Pages;
        TabID m_CurrentTab = UID::empty();
        std::vector<SelectionChangedListener> m_SelectionChangedListeners;
    };
}
