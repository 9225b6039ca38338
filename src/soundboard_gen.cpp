#include "core/file_utils.hpp"
#include "core/snippet_errors.hpp"
#include "core/soundboard_config.hpp"
#include "logging/logger.hpp"
#include <iostream>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Generate a soundboard configuration from a folder of audio files" << std::endl;
        std::cout << "Usage: " << program << " AUDIO_FOLDER [options]" << std::endl;
        std::cout << "       " << program << " --check CONFIG" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --output, -o FILE        Output path (default: AUDIO_FOLDER/soundboard.json)" << std::endl;
        std::cout << "  --absolute-paths, -a     Use absolute file paths" << std::endl;
        std::cout << "  --extensions, -e EXT     Additional extension to include (repeatable)" << std::endl;
        std::cout << "  --recursive, -r          Include audio files in subfolders" << std::endl;
        std::cout << "  --preview, -p            Print the configuration instead of writing it" << std::endl;
        std::cout << "  --check CONFIG           Validate an existing configuration" << std::endl;
        std::cout << "  --log-level LEVEL        TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h               Show this help message" << std::endl;
    }

    constexpr size_t kListedFiles = 10;
}

int main(int argc, char *argv[])
{
    Logger::init("INFO");

    std::string folder;
    std::string output_path;
    std::string check_path;
    bool absolute_paths = false;
    bool preview = false;
    bool recursive = false;
    std::vector<std::string> extensions = SoundboardConfig::defaultExtensions();

    try
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto next = [&](const std::string &flag) -> std::string
            {
                if (i + 1 >= argc)
                {
                    throw ConfigurationError(flag + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h")
            {
                printUsage(argv[0]);
                return 0;
            }
            else if (arg == "--output" || arg == "-o")
                output_path = next(arg);
            else if (arg == "--absolute-paths" || arg == "-a")
                absolute_paths = true;
            else if (arg == "--extensions" || arg == "-e")
                extensions.push_back(FileUtils::normalizeExtension(next(arg)));
            else if (arg == "--recursive" || arg == "-r")
                recursive = true;
            else if (arg == "--preview" || arg == "-p")
                preview = true;
            else if (arg == "--check")
                check_path = next(arg);
            else if (arg == "--log-level")
                Logger::init(next(arg));
            else if (!arg.empty() && arg[0] == '-')
                throw ConfigurationError("Unknown argument: " + arg);
            else if (folder.empty())
                folder = arg;
            else
                throw ConfigurationError("Unexpected argument: " + arg);
        }

        if (!check_path.empty())
        {
            nlohmann::json document = SoundboardConfig::load(check_path);
            std::cout << check_path << " is valid: " << document["layout"]["rows"].get<int>() << "x"
                      << document["layout"]["cols"].get<int>() << " grid, "
                      << (document.contains("buttons") ? document["buttons"].size() : 0) << " buttons" << std::endl;
            return 0;
        }

        if (folder.empty())
        {
            printUsage(argv[0]);
            throw ConfigurationError("AUDIO_FOLDER is required");
        }
        if (!FileUtils::isValidDirectory(folder))
        {
            throw ConfigurationError("Not a directory: " + folder);
        }

        std::vector<std::string> files = FileUtils::findAudioFiles(folder, extensions, recursive);
        if (files.empty())
        {
            std::string names;
            for (const auto &extension : extensions)
                names += (names.empty() ? "" : ", ") + extension;
            std::cout << "No audio files found in " << folder << std::endl;
            std::cout << "   Supported extensions: " << names << std::endl;
            return 0;
        }

        nlohmann::json document = SoundboardConfig::fromFiles(files, absolute_paths);
        int rows = document["layout"]["rows"].get<int>();
        int cols = document["layout"]["cols"].get<int>();
        std::cout << "Found " << files.size() << " audio files in " << folder << std::endl;
        std::cout << "Generated " << rows << "x" << cols << " grid layout (" << rows * cols << " total slots)"
                  << std::endl;
        std::cout << "Buttons created: " << document["buttons"].size() << std::endl;

        if (preview)
        {
            std::cout << std::endl
                      << document.dump(2) << std::endl;
        }
        else
        {
            if (output_path.empty())
            {
                output_path = (fs::path(folder) / "soundboard.json").string();
            }
            SoundboardConfig::save(document, output_path);
        }

        std::cout << std::endl
                  << "Audio files included:" << std::endl;
        for (size_t i = 0; i < files.size() && i < kListedFiles; ++i)
        {
            std::cout << "   " << (i + 1) << ". " << fs::path(files[i]).filename().string() << std::endl;
        }
        if (files.size() > kListedFiles)
        {
            std::cout << "   ... and " << files.size() - kListedFiles << " more files" << std::endl;
        }
        return 0;
    }
    catch (const SnippetError &e)
    {
        Logger::error(e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
