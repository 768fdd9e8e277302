#pragma once

#include <folio/Utils/CStringView.hpp>

#include <array>

namespace folio
{
    // an action in a tab's context menu
    enum class TabMenuAction {
        Close,
        CloseOthers,
        CloseAll,
    };

    // all actions, in the order that they appear in the menu
    inline constexpr std::array<TabMenuAction, 3> c_TabMenuActions =
    {
        TabMenuAction::Close,
        TabMenuAction::CloseOthers,
        TabMenuAction::CloseAll,
    };

    constexpr CStringView GetTabMenuActionLabel(TabMenuAction action)
    {
        switch (action)
        {
        case TabMenuAction::Close:
            return "Close";
        case TabMenuAction::CloseOthers:
            return "Close others";
        case TabMenuAction::CloseAll:
        default:
            return "Close all";
        }
    }
}
