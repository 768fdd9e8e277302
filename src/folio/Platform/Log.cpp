#include "Log.hpp"

#include <folio/Utils/CStringView.hpp>

#include <array>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace
{
    class StderrSink final : public folio::log::Sink {
        std::mutex mutex;

        void log(folio::log::LogMessage const& msg) override
        {
            std::lock_guard g{mutex};
            std::cerr << '[' << msg.loggerName << "] [" << folio::log::toStringView(msg.level) << "] " << msg.payload << std::endl;
        }
    };

    std::shared_ptr<folio::log::Logger>& GetGlobalDefaultLogger()
    {
        static std::shared_ptr<folio::log::Logger> s_DefaultLogger =
            std::make_shared<folio::log::Logger>("folio", std::make_shared<StderrSink>());
        return s_DefaultLogger;
    }

    constexpr std::array<folio::CStringView, static_cast<size_t>(folio::log::level::NUM_LEVELS)> c_LogLevelStrings =
    {
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    };
}

// public API

std::string_view folio::log::toStringView(level::LevelEnum level)
{
    return c_LogLevelStrings.at(level);
}

char const* folio::log::toCStr(level::LevelEnum level)
{
    return c_LogLevelStrings.at(level).c_str();
}

std::optional<folio::log::level::LevelEnum> folio::log::tryParseLevel(std::string_view s)
{
    for (size_t i = 0; i < c_LogLevelStrings.size(); ++i)
    {
        if (std::string_view{c_LogLevelStrings[i]} == s)
        {
            return static_cast<level::LevelEnum>(i);
        }
    }
    return std::nullopt;
}

std::shared_ptr<folio::log::Logger> folio::log::defaultLogger() noexcept
{
    return GetGlobalDefaultLogger();
}

folio::log::Logger* folio::log::defaultLoggerRaw() noexcept
{
    return GetGlobalDefaultLogger().get();
}

folio::log::level::LevelEnum folio::log::getLevel()
{
    return defaultLoggerRaw()->getLevel();
}

void folio::log::setLevel(level::LevelEnum lvl)
{
    defaultLoggerRaw()->setLevel(lvl);
}
