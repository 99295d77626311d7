#include "AppContext.hpp"
#include "utils/ErrorReporter.hpp"

#include <SDL3/SDL.h>
#include <imgui.h>
#include <backends/imgui_impl_sdl3.h>
#include <backends/imgui_impl_sdlrenderer3.h>
#include <plog/Log.h>

AppContext::AppContext() = default;

AppContext::~AppContext()
{
    shutdown();
}

bool AppContext::initialize(const char* title, int width, int height)
{
    if (imgui_ready_)
        return true;

    if (!initializeSDL() || !createWindow(title, width, height) || !createRenderer() || !initializeImGui())
    {
        shutdown();
        return false;
    }
    return true;
}

// Tears down whatever initialize() managed to create, in reverse order.
void AppContext::shutdown()
{
    if (imgui_ready_)
    {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        imgui_ready_ = false;
    }

    if (renderer_)
    {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_)
    {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (sdl_ready_)
    {
        SDL_Quit();
        sdl_ready_ = false;
    }
}

bool AppContext::processEvent(const SDL_Event& event)
{
    ImGui_ImplSDL3_ProcessEvent(&event);

    if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && window_ &&
        event.window.windowID == SDL_GetWindowID(window_))
    {
        return true;
    }
    return event.type == SDL_EVENT_QUIT;
}

void AppContext::beginFrame()
{
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
}

void AppContext::endFrame()
{
    ImGui::Render();
    SDL_SetRenderDrawColor(renderer_, 24, 24, 28, 255);
    SDL_RenderClear(renderer_);
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer_);
    SDL_RenderPresent(renderer_);
}

bool AppContext::initializeSDL()
{
    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        reportInitError("SDL", std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdl_ready_ = true;
    return true;
}

bool AppContext::createWindow(const char* title, int width, int height)
{
    const SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    window_ = SDL_CreateWindow(title, width, height, window_flags);
    if (!window_)
    {
        reportInitError("Window", std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }
    return true;
}

bool AppContext::createRenderer()
{
    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_)
    {
        reportInitError("Renderer", std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    // Frames are paced by vsync; the spring only sees the timestamps.
    if (!SDL_SetRenderVSync(renderer_, 1))
    {
        PLOG_WARNING << "Failed to enable VSync: " << SDL_GetError() << " (will continue without VSync)";
    }

    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    return true;
}

bool AppContext::initializeImGui()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    imgui_ready_ = true;

    if (!ImGui_ImplSDL3_InitForSDLRenderer(window_, renderer_))
    {
        reportInitError("ImGui SDL3 Backend", "ImGui_ImplSDL3_InitForSDLRenderer returned false");
        ImGui::DestroyContext();
        imgui_ready_ = false;
        return false;
    }

    if (!ImGui_ImplSDLRenderer3_Init(renderer_))
    {
        reportInitError("ImGui Renderer Backend", "ImGui_ImplSDLRenderer3_Init returned false");
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        imgui_ready_ = false;
        return false;
    }

    return true;
}

void AppContext::reportInitError(const char* phase, const std::string& details)
{
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization,
                                      std::string(phase) + " initialization failed", details);
}
