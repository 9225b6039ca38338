#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Filesystem helpers shared by the batch pipeline and the soundboard generator
 */
class FileUtils
{
public:
    /**
     * Lists the regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to descend into subdirectories
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Validates if a path is a valid directory
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Create a directory and its parents if missing
     * @return false if the path exists as something else or cannot be created
     */
    static bool ensureDirectory(const std::string &path);

    /**
     * @brief Audio files inside a folder, optionally including subfolders
     *
     * An extension matches case-insensitively; extensions may be given with
     * or without the leading dot. The result holds no duplicates and is
     * sorted by lower-cased file name.
     */
    static std::vector<std::string> findAudioFiles(const std::string &folder,
                                                   const std::vector<std::string> &extensions,
                                                   bool recursive = false);

    /**
     * @brief Path for display in a soundboard document
     *
     * Relative to the current directory when the file lies below it, absolute
     * otherwise (or always when absolute is set). Separators are forward slashes.
     */
    static std::string displayPath(const std::string &file_path, bool absolute);

    /**
     * @brief ".MP3" and "mp3" both become ".mp3"
     */
    static std::string normalizeExtension(const std::string &extension);

private:
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);
};
