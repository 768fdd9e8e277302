#include "Config.hpp"

#include <folio/Platform/Log.hpp>
#include <folio/Platform/PlatformFamily.hpp>

#include <toml++/toml.h>

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace
{
    constexpr char const* c_ConfigFileName = "folio.toml";
}

class folio::Config::Impl final {
public:
    std::optional<fs::path> configPath;
    log::level::LevelEnum logLevel = log::level::info;
    bool notebookClosable = true;
    std::optional<PlatformFamily> platformFamilyOverride;
    std::string closeIconName = "tab-close";
    std::string activeCloseIconName = "tab-close-active";
};

namespace
{
    std::optional<fs::path> TryFindConfigFile(fs::path p)
    {
        while (p.has_relative_path())
        {
            fs::path maybeConfig = p / c_ConfigFileName;
            if (fs::exists(maybeConfig))
            {
                return maybeConfig;
            }
            p = p.parent_path();
        }

        // the filesystem root
        if (fs::path maybeConfig = p / c_ConfigFileName; fs::exists(maybeConfig))
        {
            return maybeConfig;
        }
        return std::nullopt;
    }

    template<typename T>
    std::optional<T> TryGetValue(toml::node_view<toml::node const> node, char const* key)
    {
        if (!node)
        {
            return std::nullopt;
        }

        std::optional<T> rv = node.value<T>();
        if (!rv)
        {
            folio::log::warn("config: '%s' has an unexpected type: ignoring it", key);
        }
        return rv;
    }

    void ApplyTable(folio::Config::Impl& cfg, toml::table const& table)
    {
        if (auto lvl = TryGetValue<std::string>(table["log_level"], "log_level"))
        {
            if (auto parsed = folio::log::tryParseLevel(*lvl))
            {
                cfg.logLevel = *parsed;
            }
            else
            {
                folio::log::warn("config: '%s' is not a valid log level: ignoring it", lvl->c_str());
            }
        }

        if (auto closable = TryGetValue<bool>(table["notebook"]["closable"], "notebook.closable"))
        {
            cfg.notebookClosable = *closable;
        }

        if (auto family = TryGetValue<std::string>(table["platform"]["family"], "platform.family"))
        {
            if (*family == "auto")
            {
                cfg.platformFamilyOverride = std::nullopt;
            }
            else if (auto parsed = folio::TryParsePlatformFamily(*family))
            {
                cfg.platformFamilyOverride = *parsed;
            }
            else
            {
                folio::log::warn("config: '%s' is not a known platform family: falling back to 'auto'", family->c_str());
            }
        }

        if (auto name = TryGetValue<std::string>(table["style"]["close_icon"], "style.close_icon"))
        {
            cfg.closeIconName = std::move(name).value();
        }

        if (auto name = TryGetValue<std::string>(table["style"]["close_icon_active"], "style.close_icon_active"))
        {
            cfg.activeCloseIconName = std::move(name).value();
        }
    }
}

// public API

std::unique_ptr<folio::Config> folio::Config::load(fs::path const& searchStartDir)
{
    std::optional<fs::path> maybeConfigPath = TryFindConfigFile(searchStartDir);

    // can't find a config file: warn about it but carry on with defaults
    if (!maybeConfigPath)
    {
        log::info("could not find a %s configuration file: using default configuration values", c_ConfigFileName);
        return std::make_unique<Config>();
    }

    return loadFromFile(*maybeConfigPath);
}

std::unique_ptr<folio::Config> folio::Config::loadFromFile(fs::path const& p)
{
    auto rv = std::make_unique<Config>();
    rv->m_Impl->configPath = p;

    toml::table table;
    try
    {
        table = toml::parse_file(p.string());
    }
    catch (std::exception const& ex)
    {
        log::error("error parsing config toml %s: %s", p.string().c_str(), ex.what());
        log::error("folio will continue with default configuration values, but you might need to fix your config file");
        return rv;
    }

    ApplyTable(*rv->m_Impl, table);
    return rv;
}

std::unique_ptr<folio::Config> folio::Config::loadFromString(std::string_view toml)
{
    auto rv = std::make_unique<Config>();

    toml::table table;
    try
    {
        table = toml::parse(toml);
    }
    catch (std::exception const& ex)
    {
        log::error("error parsing config toml: %s", ex.what());
        return rv;
    }

    ApplyTable(*rv->m_Impl, table);
    return rv;
}

folio::Config::Config() :
    m_Impl{std::make_unique<Impl>()}
{
}

folio::Config::Config(Config&&) noexcept = default;
folio::Config& folio::Config::operator=(Config&&) noexcept = default;
folio::Config::~Config() noexcept = default;

std::optional<fs::path> const& folio::Config::getConfigPath() const
{
    return m_Impl->configPath;
}

folio::log::level::LevelEnum folio::Config::getLogLevel() const
{
    return m_Impl->logLevel;
}

bool folio::Config::isNotebookClosable() const
{
    return m_Impl->notebookClosable;
}

folio::PlatformFamily folio::Config::getPlatformFamily() const
{
    return m_Impl->platformFamilyOverride.value_or(CurrentPlatformFamily());
}

std::string const& folio::Config::getCloseIconName() const
{
    return m_Impl->closeIconName;
}

std::string const& folio::Config::getActiveCloseIconName() const
{
    return m_Impl->activeCloseIconName;
}
