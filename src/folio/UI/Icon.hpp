#pragma once

#include <folio/Utils/CStringView.hpp>

#include <string>
#include <string_view>

namespace folio
{
    // an image-like resource that a rendering backend can draw
    //
    // the glyph is what text-based backends (e.g. ImGui with an icon font)
    // draw in place of an image
    class Icon final {
    public:
        Icon(std::string_view name, std::string_view glyph) :
            m_Name{name},
            m_Glyph{glyph}
        {}

        CStringView getName() const { return m_Name; }
        CStringView getGlyph() const { return m_Glyph; }

        friend bool operator==(Icon const&, Icon const&) = default;

    private:
        std::string m_Name;
        std::string m_Glyph;
    };
}
