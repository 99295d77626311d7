#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <functional>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

// Loggers keep raw appender pointers; silence them before the appenders die.
std::vector<std::function<void()>>& silencers()
{
    static std::vector<std::function<void()>> s_silencers;
    return s_silencers;
}

} // namespace

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path, const std::string& log_dir)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    PrepareLogDirectory(log_dir);

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        auto& logger = plog::init<InstanceId>(level, file_appender.get());
        logger.setMaxSeverity(level);

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_appenders.push_back(std::move(file_appender));
        silencers().push_back([] {
            if (auto* registered = plog::get<InstanceId>())
                registered->setMaxSeverity(plog::none);
        });

        PLOG_INFO_(InstanceId) << "Logger '" << config.name << "' writing to " << config.filepath;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    for (const auto& silence : silencers())
    {
        silence();
    }
    silencers().clear();
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::PrepareLogDirectory(const std::string& log_dir)
{
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }

            if (auto level = (*logging)["level"].value<int64_t>())
            {
                if (*level >= 0 && *level <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(*level);
                }
                else
                {
                    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid logging level",
                                                 "level=" + std::to_string(*level) + ", expected 0..6");
                }
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings could not be read; using defaults",
                                     std::string(pe.description()) + "\nFile: " + config_path);
    }
}

} // namespace utils
