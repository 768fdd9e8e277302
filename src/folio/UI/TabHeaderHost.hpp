#pragma once

namespace folio { class TabHeader; }

namespace folio
{
    // the API a `TabHeader` uses to request changes from whatever owns it
    //
    // a tab header never mutates the page collection itself: it only asks its
    // host to do so
    class TabHeaderHost {
    protected:
        TabHeaderHost() = default;
        TabHeaderHost(TabHeaderHost const&) = default;
        TabHeaderHost(TabHeaderHost&&) noexcept = default;
        TabHeaderHost& operator=(TabHeaderHost const&) = default;
        TabHeaderHost& operator=(TabHeaderHost&&) noexcept = default;
    public:
        virtual ~TabHeaderHost() noexcept = default;

        void requestSelect(TabHeader const& header) { implRequestSelect(header); }
        void requestClose(TabHeader const& header) { implRequestClose(header); }

        // `except` may be `nullptr`, meaning "close all tabs"
        void requestCloseAll(TabHeader const* except) { implRequestCloseAll(except); }

    private:
        virtual void implRequestSelect(TabHeader const&) = 0;
        virtual void implRequestClose(TabHeader const&) = 0;
        virtual void implRequestCloseAll(TabHeader const*) = 0;
    };
}
