#include "CloseIconCache.hpp"

#include <folio/Platform/Log.hpp>
#include <folio/UI/Icon.hpp>
#include <folio/UI/StyleProvider.hpp>
#include <folio/Utils/Assertions.hpp>

#include <memory>
#include <string_view>
#include <utility>

folio::CloseIconCache::CloseIconCache(
    std::shared_ptr<StyleProvider> styleProvider,
    std::string_view idleIconName,
    std::string_view hoveredIconName) :

    m_StyleProvider{std::move(styleProvider)},
    m_IdleIconName{idleIconName},
    m_HoveredIconName{hoveredIconName}
{
    FOLIO_THROWING_ASSERT(m_StyleProvider != nullptr);
}

folio::CloseIconCache::~CloseIconCache() noexcept = default;

folio::Icon const& folio::CloseIconCache::getIcon(CloseIconVariant variant)
{
    if (!m_Icons)
    {
        log::debug("loading close icons (%s, %s)", m_IdleIconName.c_str(), m_HoveredIconName.c_str());

        // load both before assigning, so that a throwing load leaves the cache empty
        Icon idle = m_StyleProvider->loadIcon(m_IdleIconName);
        Icon hovered = m_StyleProvider->loadIcon(m_HoveredIconName);
        m_Icons.emplace(LoadedIcons{std::move(idle), std::move(hovered)});
    }

    return variant == CloseIconVariant::Hovered ? m_Icons->hovered : m_Icons->idle;
}
