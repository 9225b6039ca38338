#pragma once

#include <map>
#include <optional>
#include <string>

/**
 * @brief Maps a source identifier to a locally retrieved, full-length media file
 *
 * Entries are never invalidated: the same identifier always reuses the same
 * file for as long as it exists.
 */
class CacheStore
{
public:
    virtual ~CacheStore() = default;

    /**
     * @brief Look up the media file for an identifier
     * @return Local path, or std::nullopt on a miss
     */
    virtual std::optional<std::string> get(const std::string &identifier) = 0;

    /**
     * @brief Register a freshly retrieved file under an identifier
     * @return Where the cached media now lives
     */
    virtual std::string put(const std::string &identifier, const std::string &local_path) = 0;
};

/**
 * @brief Cache backed by a directory: key -> "{cache_dir}/{identifier}.{extension}"
 *
 * A zero-length file at the canonical location counts as a miss and is
 * removed so the next retrieval can recreate it.
 */
class FileSystemCacheStore : public CacheStore
{
public:
    explicit FileSystemCacheStore(const std::string &cache_dir, const std::string &extension = "m4a");

    std::optional<std::string> get(const std::string &identifier) override;
    std::string put(const std::string &identifier, const std::string &local_path) override;

    std::string getCanonicalPath(const std::string &identifier) const;

private:
    std::string cache_dir_;
    std::string extension_;
};

/**
 * @brief Process-local cache, used in tests and for embedding
 */
class InMemoryCacheStore : public CacheStore
{
public:
    std::optional<std::string> get(const std::string &identifier) override;
    std::string put(const std::string &identifier, const std::string &local_path) override;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, std::string> entries_;
};
