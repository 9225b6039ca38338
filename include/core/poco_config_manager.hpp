#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide run configuration store
 *
 * Starts from built-in defaults; a JSON file and command-line patches are
 * layered on top through load() and update(). Nested objects map to dotted
 * keys ("auth.cookies_file").
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    static nlohmann::json defaults();

    /**
     * @brief Merge a JSON file over the current values
     * @return false if the file cannot be opened
     * @throws ConfigurationError if the file is not a JSON object
     */
    bool load(const std::string &path);

    /**
     * @brief Write the effective values as JSON
     * @return false if the file cannot be opened
     */
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    // Back to built-in defaults
    void reset();

    // Convenience getters; strings are returned verbatim, without ${} expansion
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

private:
    PocoConfigManager();
    void applyPatch(const nlohmann::json &patch);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
