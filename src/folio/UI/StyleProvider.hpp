#pragma once

#include <folio/UI/Icon.hpp>
#include <folio/Utils/CStringView.hpp>

namespace folio
{
    // how context menus should be styled by a rendering backend
    struct MenuStyle final {
        float minWidth = 120.0f;
        float itemVerticalPadding = 2.0f;
    };

    // a service that provides style-related resources (icons, menu styling)
    class StyleProvider {
    protected:
        StyleProvider() = default;
        StyleProvider(StyleProvider const&) = default;
        StyleProvider(StyleProvider&&) noexcept = default;
        StyleProvider& operator=(StyleProvider const&) = default;
        StyleProvider& operator=(StyleProvider&&) noexcept = default;
    public:
        virtual ~StyleProvider() noexcept = default;

        // throws if no icon with the given name is available
        Icon loadIcon(CStringView name) { return implLoadIcon(name); }

        MenuStyle getMenuStyle() const { return implGetMenuStyle(); }

    private:
        virtual Icon implLoadIcon(CStringView) = 0;
        virtual MenuStyle implGetMenuStyle() const { return MenuStyle{}; }
    };

    // a `StyleProvider` that only uses built-in, glyph-based, icons
    class BuiltinStyleProvider final : public StyleProvider {
    private:
        Icon implLoadIcon(CStringView) override;
    };
}
