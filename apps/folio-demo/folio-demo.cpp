#include <folio/Bindings/ImGuiNotebookRenderer.hpp>
#include <folio/Bindings/SDL2Helpers.hpp>
#include <folio/Platform/Config.hpp>
#include <folio/Platform/Log.hpp>
#include <folio/UI/CloseIconCache.hpp>
#include <folio/UI/Notebook.hpp>
#include <folio/UI/StyleProvider.hpp>
#include <folio/UI/TabGestureBindings.hpp>
#include <folio/UI/Widget.hpp>

#include <imgui.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl2.h>
#include <SDL.h>
#include <SDL_opengl.h>
#undef main

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// handy macro for calling SDL_GL_SetAttribute with error checking
#define FOLIO_SDL_GL_SetAttribute_CHECK(attr, value) \
{ \
    if (SDL_GL_SetAttribute((attr), (value)) != 0) \
    { \
        throw std::runtime_error{std::string{"SDL_GL_SetAttribute failed when setting " #attr " = " #value " : "} + SDL_GetError()}; \
    } \
}

using namespace folio;

namespace
{
    constexpr std::string_view c_Usage = "usage: folio-demo [--help] [--config PATH]\n";

    constexpr std::string_view c_Help = R"(OPTIONS
    --help
        Show this help
    --config PATH
        Load configuration from PATH, rather than searching for a folio.toml
)";

    constexpr int c_NumDemoPages = 4;
    constexpr char const* c_GLSLVersion = "#version 330 core";

    // a page that shows a block of (source) text
    class TextPage final : public Widget {
    public:
        TextPage(std::string_view name, std::string text) :
            Widget{name},
            m_Text{std::move(text)}
        {
        }

    private:
        void implOnDraw() final
        {
            ImGui::TextUnformatted(m_Text.c_str(), m_Text.c_str() + m_Text.size());
        }

        std::string m_Text;
    };

    std::string GenerateDemoText(int numLines)
    {
        std::string rv;
        for (int i = 0; i < numLines; ++i)
        {
            rv += "print('hello world')\n";
        }
        return rv;
    }

    sdl::Window CreateMainWindow()
    {
        log::info("initializing main application (OpenGL 3.3) window");

        FOLIO_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        FOLIO_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        FOLIO_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_MINOR_VERSION, 3);

        constexpr Uint32 flags = SDL_WINDOW_OPENGL | SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE;
        return sdl::CreateWindoww("folio demo", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 800, 600, flags);
    }

    void ImGuiInit(SDL_Window* window, SDL_GLContext context)
    {
        ImGui::CreateContext();
        ImGui::GetIO().IniFilename = nullptr;
        ImGui_ImplSDL2_InitForOpenGL(window, context);
        ImGui_ImplOpenGL3_Init(c_GLSLVersion);
        ImGui::StyleColorsDark();
    }

    void ImGuiShutdown()
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
    }

    void ImGuiNewFrame(SDL_Window* window)
    {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame(window);
        ImGui::NewFrame();
    }

    void ImGuiRender()
    {
        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    }

    std::unique_ptr<Config> LoadConfig(std::vector<std::string_view> const& configArgs)
    {
        if (!configArgs.empty())
        {
            return Config::loadFromFile(std::filesystem::path{configArgs.back()});
        }
        return Config::load(sdl::GetBasePath());
    }

    int RunDemo(Config const& config)
    {
        sdl::Context sdlContext{SDL_INIT_VIDEO};
        sdl::Window window = CreateMainWindow();
        sdl::GLContext glContext = sdl::GL_CreateContext(window);
        SDL_GL_MakeCurrent(window, glContext);
        SDL_GL_SetSwapInterval(1);

        ImGuiInit(window, glContext);

        auto styleProvider = std::make_shared<BuiltinStyleProvider>();
        ImGuiNotebookRenderer renderer{config.getPlatformFamily(), styleProvider->getMenuStyle()};
        auto closeIcons = std::make_shared<CloseIconCache>(
            styleProvider,
            config.getCloseIconName(),
            config.getActiveCloseIconName()
        );

        // pages must outlive the notebook
        std::vector<std::unique_ptr<TextPage>> pages;
        {
            Notebook notebook{
                renderer,
                closeIcons,
                TabGestureBindings::forPlatform(config.getPlatformFamily()),
                config.isNotebookClosable()
            };
            notebook.addSelectionChangedListener([&notebook]()
            {
                if (Widget* current = notebook.getCurrentChild())
                {
                    log::info("current page: %s", current->getName().c_str());
                }
                else
                {
                    log::info("current page: (none)");
                }
            });

            for (int i = 0; i < c_NumDemoPages; ++i)
            {
                std::string const name = "program" + std::to_string(i) + ".py";
                auto& page = pages.emplace_back(std::make_unique<TextPage>(name, GenerateDemoText(i*30)));
                notebook.add(*page, name);
            }
            notebook.focus();

            bool quitRequested = false;
            while (!quitRequested)
            {
                SDL_Event e;
                while (SDL_PollEvent(&e))
                {
                    ImGui_ImplSDL2_ProcessEvent(&e);
                    if (e.type == SDL_QUIT)
                    {
                        quitRequested = true;
                    }
                }

                ImGuiNewFrame(window);
                {
                    ImGuiViewport const* viewport = ImGui::GetMainViewport();
                    ImGui::SetNextWindowPos(viewport->WorkPos);
                    ImGui::SetNextWindowSize(viewport->WorkSize);
                    constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings;
                    if (ImGui::Begin("notebook", nullptr, flags))
                    {
                        renderer.onDraw();
                    }
                    ImGui::End();
                }

                ImGuiIO const& io = ImGui::GetIO();
                glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
                glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
                glClear(GL_COLOR_BUFFER_BIT);
                ImGuiRender();
                SDL_GL_SwapWindow(window);
            }
        }

        ImGuiShutdown();
        return EXIT_SUCCESS;
    }
}

int main(int argc, char* argv[])
{
    std::vector<std::string_view> configArgs;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view const arg{argv[i]};

        if (arg == "--help")
        {
            std::cout << c_Usage << '\n' << c_Help << '\n';
            return EXIT_SUCCESS;
        }
        else if (arg == "--config" && i+1 < argc)
        {
            configArgs.emplace_back(argv[++i]);
        }
        else
        {
            std::cerr << c_Usage;
            return EXIT_FAILURE;
        }
    }

    try
    {
        std::unique_ptr<Config> config = LoadConfig(configArgs);
        log::setLevel(config->getLogLevel());
        return RunDemo(*config);
    }
    catch (std::exception const& ex)
    {
        log::critical("folio-demo: exception thrown: %s", ex.what());
        return EXIT_FAILURE;
    }
}
