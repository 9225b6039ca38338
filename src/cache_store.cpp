#include "core/cache_store.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

FileSystemCacheStore::FileSystemCacheStore(const std::string &cache_dir, const std::string &extension)
    : cache_dir_(cache_dir), extension_(extension)
{
}

std::string FileSystemCacheStore::getCanonicalPath(const std::string &identifier) const
{
    return (fs::path(cache_dir_) / (identifier + "." + extension_)).string();
}

std::optional<std::string> FileSystemCacheStore::get(const std::string &identifier)
{
    std::string path = getCanonicalPath(identifier);
    std::error_code ec;

    if (!fs::is_regular_file(path, ec))
    {
        return std::nullopt;
    }

    auto size = fs::file_size(path, ec);
    if (ec)
    {
        Logger::warn("Cannot stat cached file " + path + ": " + ec.message() + ", treating as a miss");
        return std::nullopt;
    }

    if (size == 0)
    {
        Logger::warn("Cached file " + path + " is empty, discarding it");
        fs::remove(path, ec);
        if (ec)
        {
            Logger::warn("Failed to remove empty cache file " + path + ": " + ec.message());
        }
        return std::nullopt;
    }

    Logger::info("Using cached: " + path);
    return path;
}

std::string FileSystemCacheStore::put(const std::string &identifier, const std::string &local_path)
{
    std::string canonical = getCanonicalPath(identifier);
    std::error_code ec;

    if (fs::equivalent(local_path, canonical, ec))
    {
        Logger::debug("Cached " + identifier + " at " + canonical);
        return canonical;
    }

    fs::create_directories(cache_dir_, ec);
    fs::rename(local_path, canonical, ec);
    if (ec)
    {
        // rename() fails across filesystems
        ec.clear();
        fs::copy_file(local_path, canonical, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            Logger::warn("Could not move " + local_path + " into the cache: " + ec.message());
            return local_path;
        }
        fs::remove(local_path, ec);
    }
    Logger::debug("Cached " + identifier + " at " + canonical);
    return canonical;
}

std::optional<std::string> InMemoryCacheStore::get(const std::string &identifier)
{
    auto it = entries_.find(identifier);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::string InMemoryCacheStore::put(const std::string &identifier, const std::string &local_path)
{
    entries_[identifier] = local_path;
    return local_path;
}
