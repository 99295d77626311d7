#include "Application.hpp"
#include "AppContext.hpp"
#include "SpringDemoPanel.hpp"
#include "config/ConfigManager.hpp"
#include "config/SpringSettings.hpp"
#include "springy/FrameQueue.hpp"
#include "springy/Spring.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>

#ifndef SPRINGY_VERSION_STRING
#define SPRINGY_VERSION_STRING "0.0.0"
#endif

namespace
{

constexpr Uint64 kConfigPollIntervalMs = 1000;

static void SDLCALL SDLLogBridge(void* userdata, int category, SDL_LogPriority priority, const char* message)
{
    (void)userdata;
    switch (priority)
    {
    case SDL_LOG_PRIORITY_VERBOSE:
        PLOG_VERBOSE << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_DEBUG:
        PLOG_DEBUG << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_INFO:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_WARN:
        PLOG_WARNING << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_ERROR:
        PLOG_ERROR << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_CRITICAL:
        PLOG_FATAL << "[SDL:" << category << "] " << message;
        break;
    default:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    parseCommandLineArgs();

    if (!initializeLogging())
        return false;

    PLOG_INFO << "springy demo " << SPRINGY_VERSION_STRING << " starting";

    context_ = std::make_unique<AppContext>();
    if (!context_->initialize("springy", 720, 560))
        return false;

    setupSDLLogging();
    SDL_SetAppMetadata("springy", SPRINGY_VERSION_STRING, "springy.demo");

    initializeConfig();
    setupSpring();

    last_config_poll_ = SDL_GetTicks();
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = "logs/run.log",
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = true });
}

void Application::setupSDLLogging()
{
    SDL_SetLogOutputFunction(SDLLogBridge, nullptr);
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);
    settings_ = std::make_unique<SpringSettings>();
    settings_->registerConfigHandler(*config_);

    config_loaded_ = config_->load();
    if (!config_loaded_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }
}

void Application::setupSpring()
{
    frames_ = std::make_unique<springy::FrameQueue>();
    spring_ = std::make_unique<springy::Spring>(*frames_, settings_->options());
    panel_ = std::make_unique<SpringDemoPanel>(*spring_, *settings_, *config_);

    const auto& constants = spring_->constants();
    PLOG_INFO << "Spring ready at " << spring_->value() << " -> " << spring_->target() << " (k=" << constants.stiffness
              << ", c=" << constants.damping << ")";
}

int Application::run()
{
    if (!initialize())
    {
        return -1;
    }
    mainLoop();
    return 0;
}

void Application::mainLoop()
{
    while (running_)
    {
        processEvents();
        pollConfigChanges();
        renderFrame();
        handleQuitRequests();
    }
}

void Application::processEvents()
{
    SDL_Event event;

    // Don't sleep while the spring is moving; its frames come from the loop.
    const Sint32 timeout = (spring_ && spring_->isAnimating()) ? 0 : 16;
    if (SDL_WaitEventTimeout(&event, timeout))
    {
        if (context_->processEvent(event))
            quit_requested_ = true;

        while (SDL_PollEvent(&event))
        {
            if (context_->processEvent(event))
                quit_requested_ = true;
        }
    }
}

void Application::pollConfigChanges()
{
    const Uint64 now = SDL_GetTicks();
    if (now - last_config_poll_ < kConfigPollIntervalMs)
        return;
    last_config_poll_ = now;

    if (config_->reloadIfChanged())
    {
        config_loaded_ = true;
        PLOG_DEBUG << "Spring now heading to " << spring_->target();
    }
}

void Application::renderFrame()
{
    // One frame callback batch per rendered frame, stamped in milliseconds.
    frames_->runFrame(static_cast<double>(SDL_GetTicksNS()) / 1e6);

    context_->beginFrame();
    panel_->render();
    context_->endFrame();
}

void Application::handleQuitRequests()
{
    if (!quit_requested_)
        return;

    running_ = false;
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    // A file that failed to parse is left for the user to fix.
    if (config_ && config_loaded_)
    {
        if (!config_->save())
        {
            PLOG_WARNING << "Failed to save configuration: " << config_->lastError();
        }
    }
    else if (config_)
    {
        PLOG_WARNING << "Not saving " << config_->path() << " because it could not be parsed";
    }

    // The spring cancels its frame request, so it goes before the queue.
    panel_.reset();
    spring_.reset();
    frames_.reset();
    settings_.reset();
    config_.reset();
    context_.reset();

    utils::LogManager::Shutdown();
}

void Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        if (std::strcmp(argv_[i], "--config") == 0 && i + 1 < argc_)
        {
            config_path_ = argv_[++i];
        }
    }
}
