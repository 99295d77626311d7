#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace
{

long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    // Only compared for equality, so the file clock's own epoch is fine.
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool owns(const std::vector<std::string>& keys, const std::string& key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::string describe(const toml::parse_error& pe)
{
    if (pe.source().begin.line > 0)
        return "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
    return std::string(pe.description());
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , last_mtime_(file_mtime_ms(config_path_))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (owns(handler.ownedKeys, key))
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    last_mtime_ = file_mtime_ms(config_path_);

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + describe(pe);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Keeping current settings.",
                                            describe(pe) + "\nFile: " + config_path_);
        return false;
    }

    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(std::as_const(*root_), handler.path);
        handler.callbacks.load(section ? *section : empty);
    }

    PLOG_DEBUG << "Loaded config from " << config_path_ << " (" << handlers_.size() << " handler(s))";
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    const auto mtime = file_mtime_ms(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    // load() records the new mtime, so a broken file is reported once per edit.
    if (!load())
        return false;

    PLOG_INFO << "Config reloaded from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    if (!root_)
        root_ = std::make_unique<toml::table>();

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();

        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
        {
            last_error_ = "Cannot write table '" + handler.path + "'";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_ + ": a non-table value is in the way");
            return false;
        }

        for (const auto& [key, node] : produced)
        {
            if (!owns(handler.ownedKeys, std::string(key.str())))
            {
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key.str()
                             << "' (not in ownedKeys); stripping it";
            }
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output << '\n';
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "Failed to rename: " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    last_mtime_ = file_mtime_ms(config_path_);
    *root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
        {
            auto [inserted_it, success] = current->insert(segment, toml::table{});
            if (!success)
                return nullptr;
            current = inserted_it->second.as_table();
        }
        else if (auto* tbl = it->second.as_table())
        {
            current = tbl;
        }
        else
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }

    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
            return nullptr;

        const toml::node* node = current->get(segment);
        current = node ? node->as_table() : nullptr;
        if (!current)
            return nullptr;
    }

    return current;
}
