#pragma once

#include <folio/UI/Icon.hpp>
#include <folio/UI/StyleProvider.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace folio
{
    enum class CloseIconVariant {
        Idle,
        Hovered,
    };

    // a lazily-loaded pair of close-button icons that's shared between all
    // closable tabs that use the cache
    //
    // the icons are loaded from the style provider on first use and are never
    // reloaded afterwards
    class CloseIconCache final {
    public:
        explicit CloseIconCache(
            std::shared_ptr<StyleProvider>,
            std::string_view idleIconName = "tab-close",
            std::string_view hoveredIconName = "tab-close-active"
        );
        CloseIconCache(CloseIconCache const&) = delete;
        CloseIconCache(CloseIconCache&&) noexcept = delete;
        CloseIconCache& operator=(CloseIconCache const&) = delete;
        CloseIconCache& operator=(CloseIconCache&&) noexcept = delete;
        ~CloseIconCache() noexcept;

        bool isLoaded() const { return m_Icons.has_value(); }

        // loads the icons, if necessary; throws if the style provider cannot provide them
        Icon const& getIcon(CloseIconVariant);

        StyleProvider& updStyleProvider() { return *m_StyleProvider; }

    private:
        struct LoadedIcons final {
            Icon idle;
            Icon hovered;
        };

        std::shared_ptr<StyleProvider> m_StyleProvider;
        std::string m_IdleIconName;
        std::string m_HoveredIconName;
        std::optional<LoadedIcons> m_Icons;
    };
}
