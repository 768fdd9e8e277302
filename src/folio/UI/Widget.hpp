#pragma once

#include <folio/Utils/CStringView.hpp>
#include <folio/Utils/UID.hpp>

#include <string>
#include <string_view>

namespace folio
{
    // content that can be shown in a UI region (e.g. a page of a `Notebook`)
    //
    // the name is a human-readable label (e.g. for lookups and logging). It's
    // mutable and not necessarily unique: use the widget's identity (address)
    // or `getID()` when a stable key is required
    class Widget {
    public:
        Widget() = default;
        explicit Widget(std::string_view name) : m_Name{name} {}
        Widget(Widget const&) = delete;
        Widget(Widget&&) noexcept = delete;
        Widget& operator=(Widget const&) = delete;
        Widget& operator=(Widget&&) noexcept = delete;
        virtual ~Widget() noexcept = default;

        UID getID() const { return m_ID; }

        CStringView getName() const { return m_Name; }
        void setName(std::string_view name) { m_Name = name; }

        // called by a rendering backend when the widget should draw itself
        void onDraw() { implOnDraw(); }

    private:
        virtual void implOnDraw() {}

        UID m_ID;
        std::string m_Name;
    };
}
