#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

bool FileUtils::ensureDirectory(const std::string &path)
{
    std::error_code ec;
    if (fs::is_directory(path, ec))
    {
        return true;
    }
    fs::create_directories(path, ec);
    if (ec)
    {
        Logger::error("Cannot create directory " + path + ": " + ec.message());
        return false;
    }
    return fs::is_directory(path, ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };

    scanDirectory(dir_path);
}

std::string FileUtils::normalizeExtension(const std::string &extension)
{
    std::string normalized = toLower(extension);
    if (!normalized.empty() && normalized[0] != '.')
    {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

std::vector<std::string> FileUtils::findAudioFiles(const std::string &folder,
                                                   const std::vector<std::string> &extensions,
                                                   bool recursive)
{
    std::set<std::string> wanted;
    for (const auto &extension : extensions)
    {
        wanted.insert(normalizeExtension(extension));
    }

    std::set<std::string> found;
    listFilesAsObservable(folder, recursive)
        .subscribe(
            [&](const std::string &file_path)
            {
                if (wanted.count(toLower(fs::path(file_path).extension().string())) > 0)
                {
                    found.insert(file_path);
                }
            },
            [&folder](const std::exception &e)
            {
                Logger::error("Cannot scan " + folder + ": " + e.what());
            });

    std::vector<std::string> files(found.begin(), found.end());
    std::stable_sort(files.begin(), files.end(),
                     [](const std::string &a, const std::string &b)
                     {
                         return toLower(fs::path(a).filename().string()) <
                                toLower(fs::path(b).filename().string());
                     });
    return files;
}

std::string FileUtils::displayPath(const std::string &file_path, bool absolute)
{
    std::error_code ec;
    fs::path full = fs::absolute(file_path, ec);
    if (ec)
    {
        full = fs::path(file_path);
    }
    full = full.lexically_normal();

    fs::path shown = full;
    if (!absolute)
    {
        fs::path cwd = fs::current_path(ec);
        if (!ec)
        {
            fs::path relative = full.lexically_relative(cwd);
            if (!relative.empty() && *relative.begin() != "..")
            {
                shown = relative;
            }
        }
    }

    std::string text = shown.generic_string();
    std::replace(text.begin(), text.end(), '\\', '/');
    return text;
}
