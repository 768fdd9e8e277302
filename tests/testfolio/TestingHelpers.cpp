#include "TestingHelpers.hpp"

#include <folio/Utils/Algorithms.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

size_t folio::RecordingNotebookRenderer::countCalls(RendererCallType type) const
{
    return static_cast<size_t>(std::count_if(m_Calls.begin(), m_Calls.end(), [type](RendererCall const& c) { return c.type == type; }));
}

std::vector<std::string> folio::RecordingNotebookRenderer::getPlacedTitles() const
{
    std::vector<Placement> ordered = m_Placements;
    std::sort(ordered.begin(), ordered.end(), [](Placement const& a, Placement const& b) { return a.column < b.column; });

    std::vector<std::string> rv;
    rv.reserve(ordered.size());
    for (Placement const& p : ordered)
    {
        rv.emplace_back(p.header->getTitle());
    }
    return rv;
}

folio::TabHeader* folio::RecordingNotebookRenderer::getHeaderAtColumn(size_t column) const
{
    auto const it = FindIf(m_Placements, [column](Placement const& p) { return p.column == column; });
    return it != m_Placements.end() ? it->header : nullptr;
}

void folio::RecordingNotebookRenderer::implPlaceTabHeader(TabHeader& header, size_t column)
{
    m_Calls.push_back(RendererCall{RendererCallType::PlaceTabHeader, header.getID(), nullptr, column});

    auto const it = std::find_if(m_Placements.begin(), m_Placements.end(), [&header](Placement const& p) { return p.header == &header; });
    if (it != m_Placements.end())
    {
        it->column = column;
    }
    else
    {
        m_Placements.push_back(Placement{&header, column});
    }
}

void folio::RecordingNotebookRenderer::implForgetTabHeader(TabHeader const& header)
{
    m_Calls.push_back(RendererCall{RendererCallType::ForgetTabHeader, header.getID()});
    std::erase_if(m_Placements, [&header](Placement const& p) { return p.header == &header; });
}

void folio::RecordingNotebookRenderer::implUpdateTabHeader(TabHeader const& header)
{
    m_Calls.push_back(RendererCall{RendererCallType::UpdateTabHeader, header.getID()});
}

void folio::RecordingNotebookRenderer::implRaiseContent(Widget& content)
{
    m_Calls.push_back(RendererCall{RendererCallType::RaiseContent, UID::empty(), &content});
    m_RaisedContent = &content;
}

void folio::RecordingNotebookRenderer::implForgetContent(Widget const& content)
{
    m_Calls.push_back(RendererCall{RendererCallType::ForgetContent, UID::empty(), &content});
    if (m_RaisedContent == &content)
    {
        m_RaisedContent = nullptr;
    }
}

void folio::RecordingNotebookRenderer::implPopupTabMenu(TabHeader& header, glm::vec2 position)
{
    m_Calls.push_back(RendererCall{RendererCallType::PopupTabMenu, header.getID(), nullptr, 0, position});
    m_PopupHeader = header.getID();
}

void folio::RecordingNotebookRenderer::implFocusContent(Widget& content)
{
    m_Calls.push_back(RendererCall{RendererCallType::FocusContent, UID::empty(), &content});
}

void folio::RecordingNotebookRenderer::implFocusNotebook()
{
    m_Calls.push_back(RendererCall{RendererCallType::FocusNotebook});
}

folio::Icon folio::CountingStyleProvider::implLoadIcon(CStringView name)
{
    ++m_NumLoads;
    m_LoadedNames.emplace_back(name);
    return Icon{name, name};
}

bool folio::CapturingLogSink::containsMessage(std::string_view substring) const
{
    return std::any_of(m_Messages.begin(), m_Messages.end(), [substring](std::string const& m)
    {
        return m.find(substring) != std::string::npos;
    });
}

void folio::CapturingLogSink::log(log::LogMessage const& msg)
{
    m_Messages.emplace_back(msg.payload);
}

folio::ScopedLogCapture::ScopedLogCapture() :
    m_Sink{std::make_shared<CapturingLogSink>()}
{
    log::defaultLogger()->sinks().push_back(m_Sink);
}

folio::ScopedLogCapture::~ScopedLogCapture() noexcept
{
    auto& sinks = log::defaultLogger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), m_Sink), sinks.end());
}
