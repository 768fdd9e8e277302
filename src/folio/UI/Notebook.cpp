#include "Notebook.hpp"

#include <folio/Platform/Log.hpp>
#include <folio/UI/CloseIconCache.hpp>
#include <folio/UI/NotebookErrors.hpp>
#include <folio/UI/NotebookRenderer.hpp>
#include <folio/UI/TabHeader.hpp>
#include <folio/UI/Widget.hpp>
#include <folio/Utils/Algorithms.hpp>
#include <folio/Utils/Assertions.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace
{
    std::string IndexOutOfRangeMessage(size_t index, size_t numTabs)
    {
        std::stringstream ss;
        ss << "tab index " << index << " is out of range (the notebook has " << numTabs << " tabs)";
        return std::move(ss).str();
    }
}

struct folio::Notebook::Page final {
    TabID id;
    Widget* content;
    std::unique_ptr<TabHeader> header;
};

folio::Notebook::Notebook(
    NotebookRenderer& renderer,
    std::shared_ptr<CloseIconCache> closeIcons,
    TabGestureBindings bindings,
    bool closable) :

    m_Renderer{&renderer},
    m_CloseIcons{std::move(closeIcons)},
    m_Bindings{std::move(bindings)},
    m_Closable{closable}
{
    FOLIO_THROWING_ASSERT(m_CloseIcons != nullptr);
}

folio::Notebook::~Notebook() noexcept
{
    for (Page const& page : m_Pages)
    {
        m_Renderer->forgetTabHeader(*page.header);
        m_Renderer->forgetContent(*page.content);
    }
}

size_t folio::Notebook::size() const
{
    return m_Pages.size();
}

bool folio::Notebook::empty() const
{
    return m_Pages.empty();
}

folio::TabID folio::Notebook::add(Widget& content, std::string_view title)
{
    return insert(c_EndOfTabs, content, title);
}

folio::TabID folio::Notebook::insert(size_t pos, Widget& content, std::string_view title)
{
    if (pos > m_Pages.size())
    {
        throw TabIndexError{IndexOutOfRangeMessage(pos, m_Pages.size())};
    }
    if (tryIndexOf(content))
    {
        throw std::invalid_argument{TabLocator{content}.toString() + ": is already a page of this notebook"};
    }

    auto header = std::make_unique<TabHeader>(
        static_cast<TabHeaderHost&>(*this),
        *m_Renderer,
        *m_CloseIcons,
        m_Bindings,
        title,
        m_Closable
    );

    TabID const id;
    m_Pages.insert(m_Pages.begin() + static_cast<ptrdiff_t>(pos), Page{id, &content, std::move(header)});
    log::debug("notebook: inserted '%s' at %zu (%zu tabs)", std::string{title}.c_str(), pos, m_Pages.size());

    rearrangeTabs();
    selectByIndex(pos);

    return id;
}

folio::TabID folio::Notebook::insert(EndOfTabs, Widget& content, std::string_view title)
{
    return insert(m_Pages.size(), content, title);
}

void folio::Notebook::forget(Widget const& content)
{
    std::optional<size_t> const maybeIndex = tryIndexOf(content);
    if (!maybeIndex)
    {
        throw TabNotFoundError{TabLocator{content}.toString() + ": no such tab"};
    }
    size_t const index = *maybeIndex;

    // the page (and its header) is destroyed at the end of this scope
    Page page = std::move(m_Pages[index]);
    bool const wasCurrent = page.id == m_CurrentTab;

    m_Renderer->forgetTabHeader(*page.header);
    m_Renderer->forgetContent(*page.content);
    m_Pages.erase(m_Pages.begin() + static_cast<ptrdiff_t>(index));
    log::debug("notebook: forgot '%s' (%zu tabs)", page.header->getTitle().c_str(), m_Pages.size());

    rearrangeTabs();

    if (!wasCurrent)
    {
        return;
    }

    if (m_Pages.empty())
    {
        m_CurrentTab = UID::empty();
    }
    else
    {
        // the right neighbor (now at `index`) or, if the last tab was removed, the new last tab
        Page& next = m_Pages[std::min(index, m_Pages.size() - 1)];
        m_CurrentTab = next.id;
        next.header->setActive(true);
        m_Renderer->raiseContent(*next.content);
    }
    emitSelectionChanged();
}

std::optional<folio::TabID> folio::Notebook::select() const
{
    if (!m_CurrentTab)
    {
        return std::nullopt;
    }
    return m_CurrentTab;
}

void folio::Notebook::select(TabLocator const& locator)
{
    selectByIndex(index(locator));
}

void folio::Notebook::selectByIndex(size_t index)
{
    Page& next = getPageOrThrow(index);
    if (next.id == m_CurrentTab)
    {
        return;  // already selected
    }

    if (std::optional<size_t> const prev = getCurrentIndex())
    {
        m_Pages[*prev].header->setActive(false);
    }
    next.header->setActive(true);
    m_Renderer->raiseContent(*next.content);
    m_CurrentTab = next.id;

    log::debug("notebook: selected '%s' (index %zu)", next.header->getTitle().c_str(), index);
    emitSelectionChanged();
}

void folio::Notebook::selectTab(TabHeader const& header)
{
    std::optional<size_t> const index = tryIndexOfHeader(header);
    if (!index)
    {
        throw TabNotFoundError{"tab '" + header.getTitle() + "': is not a tab of this notebook"};
    }
    selectByIndex(*index);
}

size_t folio::Notebook::index(TabLocator const& locator) const
{
    if (std::optional<size_t> const rv = tryIndexOf(locator))
    {
        return *rv;
    }
    throw TabNotFoundError{locator.toString() + ": no such tab"};
}

void folio::Notebook::setTabTitle(TabLocator const& locator, std::string_view title)
{
    getPageOrThrow(index(locator)).header->setTitle(title);
}

folio::CStringView folio::Notebook::getTabTitle(TabLocator const& locator) const
{
    return getPageOrThrow(index(locator)).header->getTitle();
}

std::vector<folio::TabID> folio::Notebook::tabs() const
{
    std::vector<TabID> rv;
    rv.reserve(m_Pages.size());
    for (Page const& page : m_Pages)
    {
        rv.push_back(page.id);
    }
    return rv;
}

std::vector<folio::Widget*> folio::Notebook::getChildren() const
{
    std::vector<Widget*> rv;
    rv.reserve(m_Pages.size());
    for (Page const& page : m_Pages)
    {
        rv.push_back(page.content);
    }
    return rv;
}

folio::Widget& folio::Notebook::getChildByIndex(size_t index) const
{
    return *getPageOrThrow(index).content;
}

folio::Widget* folio::Notebook::getCurrentChild() const
{
    std::optional<size_t> const index = getCurrentIndex();
    return index ? m_Pages[*index].content : nullptr;
}

std::optional<size_t> folio::Notebook::getCurrentIndex() const
{
    if (!m_CurrentTab)
    {
        return std::nullopt;
    }
    std::optional<size_t> const rv = IndexOfIf(m_Pages, [id = m_CurrentTab](Page const& page) { return page.id == id; });
    FOLIO_ASSERT(rv.has_value() && "the current tab should always be one of the notebook's tabs");
    return rv;
}

folio::TabHeader& folio::Notebook::updTabHeaderByIndex(size_t index)
{
    return *getPageOrThrow(index).header;
}

void folio::Notebook::closeTab(TabHeader const& header)
{
    std::optional<size_t> const index = tryIndexOfHeader(header);
    if (!index)
    {
        throw TabNotFoundError{"tab '" + header.getTitle() + "': is not a tab of this notebook"};
    }
    forget(*m_Pages[*index].content);
}

void folio::Notebook::closeTabs(TabHeader const* except)
{
    std::optional<UID> exceptID;
    if (except)
    {
        if (!tryIndexOfHeader(*except))
        {
            throw TabNotFoundError{"tab '" + except->getTitle() + "': is not a tab of this notebook"};
        }
        exceptID = except->getID();
    }

    // close from the last tab to the first, so that closing a tab never shifts
    // the index of a tab that has yet to be closed
    std::vector<TabID> ids = tabs();
    std::reverse(ids.begin(), ids.end());

    log::info("notebook: closing %zu tabs", exceptID ? ids.size() - 1 : ids.size());

    for (TabID const& id : ids)
    {
        auto const it = FindIf(m_Pages, [&id](Page const& page) { return page.id == id; });
        if (it == m_Pages.end())
        {
            continue;  // already closed (e.g. by a selection-changed listener)
        }
        if (exceptID && it->header->getID() == *exceptID)
        {
            continue;
        }
        forget(*it->content);
    }
}

void folio::Notebook::focus()
{
    if (Widget* current = getCurrentChild())
    {
        m_Renderer->focusContent(*current);
    }
    else
    {
        m_Renderer->focusNotebook();
    }
}

folio::UID folio::Notebook::addSelectionChangedListener(std::function<void()> callback)
{
    FOLIO_THROWING_ASSERT(callback != nullptr);

    UID const id;
    m_SelectionChangedListeners.push_back(SelectionChangedListener{id, std::move(callback)});
    return id;
}

bool folio::Notebook::removeSelectionChangedListener(UID id)
{
    auto const it = FindIf(m_SelectionChangedListeners, [id](SelectionChangedListener const& l) { return l.id == id; });
    if (it == m_SelectionChangedListeners.end())
    {
        return false;
    }
    m_SelectionChangedListeners.erase(it);
    return true;
}

void folio::Notebook::implRequestSelect(TabHeader const& header)
{
    selectTab(header);
}

void folio::Notebook::implRequestClose(TabHeader const& header)
{
    closeTab(header);
}

void folio::Notebook::implRequestCloseAll(TabHeader const* except)
{
    closeTabs(except);
}

std::optional<size_t> folio::Notebook::tryIndexOf(TabLocator const& locator) const
{
    return locator.visit([this](auto const& v) -> std::optional<size_t>
    {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, EndOfTabs>)
        {
            return m_Pages.size();
        }
        else if constexpr (std::is_same_v<T, TabID>)
        {
            return IndexOfIf(m_Pages, [&v](Page const& page) { return page.id == v; });
        }
        else if constexpr (std::is_same_v<T, Widget const*>)
        {
            return IndexOfIf(m_Pages, [v](Page const& page) { return page.content == v; });
        }
        else
        {
            return IndexOfIf(m_Pages, [&v](Page const& page) { return std::string_view{page.content->getName()} == v; });
        }
    });
}

std::optional<size_t> folio::Notebook::tryIndexOfHeader(TabHeader const& header) const
{
    return IndexOfIf(m_Pages, [&header](Page const& page) { return page.header.get() == &header; });
}

folio::Notebook::Page& folio::Notebook::getPageOrThrow(size_t index)
{
    if (index >= m_Pages.size())
    {
        throw TabIndexError{IndexOutOfRangeMessage(index, m_Pages.size())};
    }
    return m_Pages[index];
}

folio::Notebook::Page const& folio::Notebook::getPageOrThrow(size_t index) const
{
    if (index >= m_Pages.size())
    {
        throw TabIndexError{IndexOutOfRangeMessage(index, m_Pages.size())};
    }
    return m_Pages[index];
}

void folio::Notebook::rearrangeTabs()
{
    for (size_t i = 0; i < m_Pages.size(); ++i)
    {
        m_Renderer->placeTabHeader(*m_Pages[i].header, i);
    }
}

void folio::Notebook::emitSelectionChanged()
{
    // copied, so that listeners can (un)register listeners while being called
    std::vector<SelectionChangedListener> const listeners = m_SelectionChangedListeners;
    for (SelectionChangedListener const& listener : listeners)
    {
        try
        {
            listener.callback();
        }
        catch (std::exception const& ex)
        {
            log::error("notebook: a selection-changed listener threw an exception: %s", ex.what());
        }
    }
}
