#include "core/poco_config_manager.hpp"
#include "core/snippet_errors.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    applyPatch(defaults());
}

nlohmann::json PocoConfigManager::defaults()
{
    return {
        {"log_level", "INFO"},
        {"output_dir", "snippets"},
        {"cache_dir", "downloads"},
        {"default_format", "m4a"},
        {"trim_mode", "fast"},
        {"precise_bitrate", "192k"},
        {"auth", {{"cookies_file", ""}, {"cookies_from_browser", ""}}},
        {"soundboard", {{"ready", false}, {"config_path", ""}, {"rows", 0}, {"cols", 0}}},
        {"tools", {{"ytdlp", "yt-dlp"}, {"ffmpeg", "ffmpeg"}}}};
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json patch;
    try
    {
        patch = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigurationError("Invalid JSON in " + path + ": " + e.what());
    }
    if (!patch.is_object())
    {
        throw ConfigurationError("Configuration file " + path + " must contain a JSON object");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    applyPatch(defaults());
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Raw lookup: paths may legitimately contain "${"
    return cfg_->getRawString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        throw ConfigurationError("Configuration value '" + key + "' must be an integer");
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        throw ConfigurationError("Configuration value '" + key + "' must be a boolean");
    }
}
