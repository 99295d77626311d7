#pragma once

#include <SDL3/SDL.h>
#include <string>

// SDL window, renderer and Dear ImGui backends of the demo.
class AppContext
{
public:
    AppContext();
    ~AppContext();

    bool initialize(const char* title, int width, int height);
    void shutdown();

    // Returns true when the platform asked the app to quit.
    bool processEvent(const SDL_Event& event);
    void beginFrame();
    void endFrame();

    SDL_Window* window() const { return window_; }
    SDL_Renderer* renderer() const { return renderer_; }

private:
    bool initializeSDL();
    bool createWindow(const char* title, int width, int height);
    bool createRenderer();
    bool initializeImGui();
    void reportInitError(const char* phase, const std::string& details);

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    bool sdl_ready_ = false;
    bool imgui_ready_ = false;
};
