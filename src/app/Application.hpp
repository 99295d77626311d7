#pragma once

#include <memory>
#include <string>
#include <SDL3/SDL.h>

class AppContext;
class ConfigManager;
class SpringSettings;
class SpringDemoPanel;

namespace springy
{
class FrameQueue;
class Spring;
} // namespace springy

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initialize();
    bool initializeLogging();
    void setupSDLLogging();
    void initializeConfig();
    void setupSpring();

    void mainLoop();
    void processEvents();
    void pollConfigChanges();
    void renderFrame();

    void handleQuitRequests();
    void cleanup();

    void parseCommandLineArgs();

    std::unique_ptr<AppContext> context_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<SpringSettings> settings_;
    std::unique_ptr<springy::FrameQueue> frames_;
    std::unique_ptr<springy::Spring> spring_;
    std::unique_ptr<SpringDemoPanel> panel_;

    std::string config_path_ = "config.toml";
    bool quit_requested_ = false;
    bool running_ = true;
    bool cleaned_up_ = false;
    bool config_loaded_ = false;
    Uint64 last_config_poll_ = 0;

    int argc_ = 0;
    char** argv_ = nullptr;
};
