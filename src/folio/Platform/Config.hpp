#pragma once

#include <folio/Platform/Log.hpp>
#include <folio/Platform/PlatformFamily.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace folio
{
    // runtime configuration, usually loaded from a `folio.toml` file
    //
    // all values have sensible defaults, so a missing or broken configuration
    // file only results in logged warnings
    class Config final {
    public:
        // search upwards from `searchStartDir` for a `folio.toml` and load it, or
        // return a default config if no file can be found
        static std::unique_ptr<Config> load(std::filesystem::path const& searchStartDir);

        // load the config from a specific file
        static std::unique_ptr<Config> loadFromFile(std::filesystem::path const&);

        // load the config from a string containing TOML (handy for testing)
        static std::unique_ptr<Config> loadFromString(std::string_view);

        Config();
        Config(Config const&) = delete;
        Config(Config&&) noexcept;
        Config& operator=(Config const&) = delete;
        Config& operator=(Config&&) noexcept;
        ~Config() noexcept;

        // returns the location of the file this config was loaded from, if any
        std::optional<std::filesystem::path> const& getConfigPath() const;

        log::level::LevelEnum getLogLevel() const;

        // returns `true` if notebooks should render close buttons on their tabs
        bool isNotebookClosable() const;

        // returns the configured platform family, or the compiled-for family if
        // it is set to "auto"
        PlatformFamily getPlatformFamily() const;

        std::string const& getCloseIconName() const;
        std::string const& getActiveCloseIconName() const;

        class Impl;
    private:
        std::unique_ptr<Impl> m_Impl;
    };
}
