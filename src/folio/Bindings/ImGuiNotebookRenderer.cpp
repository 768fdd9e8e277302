#include "ImGuiNotebookRenderer.hpp"

#include <folio/Platform/KeyModifier.hpp>
#include <folio/Platform/Log.hpp>
#include <folio/Platform/PhysicalMouseButton.hpp>
#include <folio/UI/Icon.hpp>
#include <folio/UI/TabHeader.hpp>
#include <folio/UI/Widget.hpp>
#include <folio/Utils/Algorithms.hpp>

#include <glm/vec2.hpp>
#include <imgui.h>

#include <algorithm>
#include <array>
#include <cfloat>
#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

namespace
{
    constexpr char const* c_TabMenuPopupID = "##folio_tab_menu";
    constexpr float c_ActiveIndicatorThickness = 3.0f;
    constexpr float c_InactiveIndicatorThickness = 1.0f;

    struct ImGuiButtonMapping final {
        ImGuiMouseButton imguiButton;
        folio::LogicalMouseButton logicalButton;
    };

    constexpr std::array<ImGuiButtonMapping, 3> c_ButtonMappings =
    {{
        {ImGuiMouseButton_Left, folio::LogicalMouseButton::Left},
        {ImGuiMouseButton_Right, folio::LogicalMouseButton::Right},
        {ImGuiMouseButton_Middle, folio::LogicalMouseButton::Middle},
    }};

    folio::KeyModifiers GetKeyModifiers(ImGuiIO const& io)
    {
        folio::KeyModifiers rv;
        if (io.KeyShift)
        {
            rv = rv.with(folio::KeyModifier::Shift);
        }
        if (io.KeyCtrl)
        {
            rv = rv.with(folio::KeyModifier::Ctrl);
        }
        if (io.KeyAlt)
        {
            rv = rv.with(folio::KeyModifier::Alt);
        }
        if (io.KeySuper)
        {
            rv = rv.with(folio::KeyModifier::Meta);
        }
        return rv;
    }

    ImVec2 ToImVec2(glm::vec2 v)
    {
        return ImVec2{v.x, v.y};
    }

    glm::vec2 ToVec2(ImVec2 v)
    {
        return glm::vec2{v.x, v.y};
    }
}

folio::ImGuiNotebookRenderer::ImGuiNotebookRenderer(PlatformFamily family, MenuStyle menuStyle) :
    m_PlatformFamily{family},
    m_MenuStyle{menuStyle}
{
}

void folio::ImGuiNotebookRenderer::onDraw()
{
    ImGui::PushID(this);
    drawTabRow();
    drawTabMenu();
    drawContent();
    ImGui::PopID();

    // deliver inputs after the frame's widgets are submitted, because handling
    // an input may add/remove tabs
    dispatchPendingInputs();
}

void folio::ImGuiNotebookRenderer::implPlaceTabHeader(TabHeader& header, size_t column)
{
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

void folio::ImGuiNotebookRenderer::implForgetTabHeader(TabHeader const& header)
{
    std::erase_if(m_Placements, [&header](Placement const& p) { return p.header == &header; });
    std::erase_if(m_PendingInputs, [id = header.getID()](PendingInput const& input) { return input.headerID == id; });
    if (m_PopupHeader == header.getID())
    {
        m_PopupHeader = UID::empty();
    }
    if (m_PopupRequest == header.getID())
    {
        m_PopupRequest.reset();
    }
}

void folio::ImGuiNotebookRenderer::implUpdateTabHeader(TabHeader const& header)
{
    // nothing to retain: the header's state is re-read when it's next drawn
    log::trace("%s: tab header state changed", header.getTitle().c_str());
}

void folio::ImGuiNotebookRenderer::implRaiseContent(Widget& content)
{
    m_RaisedContent = &content;
}

void folio::ImGuiNotebookRenderer::implForgetContent(Widget const& content)
{
    if (m_RaisedContent == &content)
    {
        m_RaisedContent = nullptr;
    }
    if (m_ContentFocusRequest == &content)
    {
        m_ContentFocusRequest = nullptr;
    }
}

void folio::ImGuiNotebookRenderer::implPopupTabMenu(TabHeader& header, glm::vec2 screenPosition)
{
    m_PopupRequest = header.getID();
    m_PopupPosition = screenPosition;
}

void folio::ImGuiNotebookRenderer::implFocusContent(Widget& content)
{
    m_ContentFocusRequest = &content;
    m_NotebookFocusRequested = false;
}

void folio::ImGuiNotebookRenderer::implFocusNotebook()
{
    m_ContentFocusRequest = nullptr;
    m_NotebookFocusRequested = true;
}

void folio::ImGuiNotebookRenderer::drawTabRow()
{
    if (m_NotebookFocusRequested)
    {
        ImGui::SetWindowFocus();
        m_NotebookFocusRequested = false;
    }

    std::vector<Placement> ordered = m_Placements;
    std::stable_sort(ordered.begin(), ordered.end(), [](Placement const& a, Placement const& b)
    {
        return a.column < b.column;
    });

    for (Placement const& placement : ordered)
    {
        drawTabHeader(*placement.header);
        ImGui::SameLine();
    }
    ImGui::NewLine();
    ImGui::Separator();
}

void folio::ImGuiNotebookRenderer::drawTabHeader(TabHeader& header)
{
    ImGui::PushID(static_cast<int>(header.getID().get()));
    ImGui::BeginGroup();

    // label
    {
        ImVec2 const labelDims = ImGui::CalcTextSize(header.getTitle().c_str());
        ImGui::Selectable(header.getTitle().c_str(), header.isActive(), ImGuiSelectableFlags_None, labelDims);
        queueButtonEvents(header, TabHeaderPart::Label);
    }

    // close button
    if (Icon const* icon = header.getCloseIcon())
    {
        ImGui::SameLine();
        ImGui::PushStyleColor(ImGuiCol_Button, ImVec4{0.0f, 0.0f, 0.0f, 0.0f});
        ImGui::SmallButton(icon->getGlyph().c_str());
        ImGui::PopStyleColor();
        queueButtonEvents(header, TabHeaderPart::CloseButton);

        bool const hovered = ImGui::IsItemHovered();
        if (hovered != header.isCloseButtonHovered())
        {
            PendingInput input{header.getID(), HeaderEvent{TabHeaderPart::CloseButton, hovered ? PointerEvent::enter() : PointerEvent::leave()}};
            m_PendingInputs.push_back(std::move(input));
        }
    }

    ImGui::EndGroup();

    // selection indicator (underline)
    {
        ImVec2 const min = ImGui::GetItemRectMin();
        ImVec2 const max = ImGui::GetItemRectMax();
        float const thickness = header.isActive() ? c_ActiveIndicatorThickness : c_InactiveIndicatorThickness;
        ImU32 const color = ImGui::GetColorU32(header.isActive() ? ImGuiCol_HeaderActive : ImGuiCol_Border);
        ImGui::GetWindowDrawList()->AddLine({min.x, max.y}, {max.x, max.y}, color, thickness);
    }

    ImGui::PopID();
}

void folio::ImGuiNotebookRenderer::queueButtonEvents(TabHeader const& header, TabHeaderPart part)
{
    ImGuiIO const& io = ImGui::GetIO();
    for (ImGuiButtonMapping const& mapping : c_ButtonMappings)
    {
        if (!ImGui::IsItemClicked(mapping.imguiButton))
        {
            continue;
        }

        PointerEvent const e = PointerEvent::button_down(
            ToPhysicalButton(mapping.logicalButton, m_PlatformFamily),
            GetKeyModifiers(io),
            ToVec2(io.MousePos)
        );
        m_PendingInputs.push_back(PendingInput{header.getID(), HeaderEvent{part, e}});
    }
}

void folio::ImGuiNotebookRenderer::drawTabMenu()
{
    if (m_PopupRequest)
    {
        m_PopupHeader = *m_PopupRequest;
        m_PopupRequest.reset();
        ImGui::SetNextWindowPos(ToImVec2(m_PopupPosition));
        ImGui::OpenPopup(c_TabMenuPopupID);
    }

    ImGui::SetNextWindowSizeConstraints({m_MenuStyle.minWidth, 0.0f}, {FLT_MAX, FLT_MAX});
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, {ImGui::GetStyle().ItemSpacing.x, m_MenuStyle.itemVerticalPadding});
    if (ImGui::BeginPopup(c_TabMenuPopupID))
    {
        if (!m_PopupHeader)
        {
            // the header was removed while its menu was open
            ImGui::CloseCurrentPopup();
        }

        for (TabMenuAction action : c_TabMenuActions)
        {
            if (ImGui::MenuItem(GetTabMenuActionLabel(action).c_str()) && m_PopupHeader)
            {
                m_PendingInputs.push_back(PendingInput{m_PopupHeader, action});
            }
        }
        ImGui::EndPopup();
    }
    ImGui::PopStyleVar();
}

void folio::ImGuiNotebookRenderer::drawContent()
{
    if (m_ContentFocusRequest)
    {
        ImGui::SetNextWindowFocus();
    }

    if (ImGui::BeginChild("##folio_notebook_content"))
    {
        if (m_RaisedContent)
        {
            m_RaisedContent->onDraw();
        }
    }
    ImGui::EndChild();

    m_ContentFocusRequest = nullptr;
}

void folio::ImGuiNotebookRenderer::dispatchPendingInputs()
{
    std::vector<PendingInput> inputs;
    std::swap(inputs, m_PendingInputs);

    for (PendingInput const& input : inputs)
    {
        // looked up each time: an earlier input may have destroyed the header
        TabHeader* header = findHeader(input.headerID);
        if (!header)
        {
            continue;
        }

        if (HeaderEvent const* e = std::get_if<HeaderEvent>(&input.input))
        {
            header->onEvent(e->part, e->event);
        }
        else if (TabMenuAction const* action = std::get_if<TabMenuAction>(&input.input))
        {
            header->activateMenuItem(*action);
        }
    }
}

folio::TabHeader* folio::ImGuiNotebookRenderer::findHeader(UID id) const
{
    auto const it = FindIf(m_Placements, [id](Placement const& p) { return p.header->getID() == id; });
    return it != m_Placements.end() ? it->header : nullptr;
}
