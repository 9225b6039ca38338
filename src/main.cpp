#include "core/poco_config_manager.hpp"
#include "core/process_runner.hpp"
#include "core/run_config.hpp"
#include "core/shutdown_manager.hpp"
#include "core/snippet_batch_runner.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace
{
    constexpr int kExitOk = SnippetBatchRunner::kExitOk;
    constexpr int kExitFailure = SnippetBatchRunner::kExitFailure;

    void printUsage(const char *program)
    {
        std::cout << "Batch-extract trimmed audio clips listed in a CSV job table" << std::endl;
        std::cout << "Usage: " << program << " --csv FILE [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --csv FILE                         Job table (url,start,end[,output][,format])" << std::endl;
        std::cout << "  --config FILE                      JSON run configuration" << std::endl;
        std::cout << "  --write-config FILE                Save the effective configuration and exit" << std::endl;
        std::cout << "  --format m4a|mp3|wav               Default output format (default: m4a)" << std::endl;
        std::cout << "  --precise                          Re-encode for frame-accurate cuts" << std::endl;
        std::cout << "  --outdir DIR                       Output directory (default: snippets)" << std::endl;
        std::cout << "  --tempdir DIR                      Download cache directory (default: downloads)" << std::endl;
        std::cout << "  --cookies FILE                     Netscape cookies.txt for yt-dlp" << std::endl;
        std::cout << "  --cookies-from-browser NAME        Read cookies from a browser, falling back to none" << std::endl;
        std::cout << "  --soundboard-ready                 Write wav clips and a soundboard configuration" << std::endl;
        std::cout << "  --generate-soundboard-config PATH  Write a soundboard configuration to PATH" << std::endl;
        std::cout << "  --soundboard-layout ROWS COLS      Fixed grid instead of a computed one" << std::endl;
        std::cout << "  --log-level LEVEL                  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --version                          Show the version" << std::endl;
        std::cout << "  --help, -h                         Show this help message" << std::endl;
    }

    int parsePositive(const std::string &flag, const std::string &value)
    {
        int number = 0;
        try
        {
            size_t used = 0;
            number = std::stoi(value, &used);
            if (used != value.size())
                number = 0;
        }
        catch (const std::exception &)
        {
            number = 0;
        }
        if (number <= 0)
        {
            throw ConfigurationError(flag + " expects positive integers, got '" + value + "'");
        }
        return number;
    }
}

int main(int argc, char *argv[])
{
    // Interrupts are only recorded; the batch stops between jobs
    ShutdownManager::getInstance().installSignalHandlers();
    Logger::init("INFO");

    std::string csv_path;
    std::string config_path;
    std::string write_config_path;
    nlohmann::json overrides = nlohmann::json::object();

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
                return kExitOk;
            }
            else if (arg == "--version")
            {
                std::cout << "snippet_batch " << SNIPPET_BATCH_VERSION << std::endl;
                return kExitOk;
            }
            else if (arg == "--csv")
                csv_path = next(arg);
            else if (arg == "--config")
                config_path = next(arg);
            else if (arg == "--write-config")
                write_config_path = next(arg);
            else if (arg == "--format")
                overrides["default_format"] = next(arg);
            else if (arg == "--precise")
                overrides["trim_mode"] = "precise";
            else if (arg == "--outdir")
                overrides["output_dir"] = next(arg);
            else if (arg == "--tempdir")
                overrides["cache_dir"] = next(arg);
            else if (arg == "--cookies")
                overrides["auth"]["cookies_file"] = next(arg);
            else if (arg == "--cookies-from-browser")
                overrides["auth"]["cookies_from_browser"] = next(arg);
            else if (arg == "--soundboard-ready")
                overrides["soundboard"]["ready"] = true;
            else if (arg == "--generate-soundboard-config")
                overrides["soundboard"]["config_path"] = next(arg);
            else if (arg == "--soundboard-layout")
            {
                overrides["soundboard"]["rows"] = parsePositive(arg, next(arg));
                overrides["soundboard"]["cols"] = parsePositive(arg, next(arg));
            }
            else if (arg == "--log-level")
                overrides["log_level"] = next(arg);
            else
            {
                throw ConfigurationError("Unknown argument: " + arg);
            }
        }

        auto &config_manager = PocoConfigManager::getInstance();
        if (!config_path.empty() && !config_manager.load(config_path))
        {
            throw ConfigurationError("Cannot read configuration file: " + config_path);
        }
        config_manager.update(overrides);

        if (!write_config_path.empty())
        {
            if (!config_manager.save(write_config_path))
            {
                throw ConfigurationError("Cannot write configuration file: " + write_config_path);
            }
            std::cout << "Wrote configuration to " << write_config_path << std::endl;
            return kExitOk;
        }

        if (csv_path.empty())
        {
            printUsage(argv[0]);
            throw ConfigurationError("--csv is required");
        }

        RunConfig config = RunConfig::fromConfig(config_manager);
        Logger::init(config.log_level);

        PosixProcessRunner runner;
        SnippetBatchRunner batch(config, runner, ShutdownManager::getInstance().cancellationCheck());
        int exit_code = batch.run(csv_path);
        if (exit_code == SnippetBatchRunner::kExitOk)
        {
            const BatchReport &report = batch.getReport();
            std::cout << "Done: " << report.countWith(JobStatus::COMPLETED) << " completed, "
                      << report.countWith(JobStatus::FAILED) << " failed, "
                      << report.countWith(JobStatus::SKIPPED) << " skipped in "
                      << report.totalProcessingTimeMs() << " ms" << std::endl;
        }
        return exit_code;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(e.what());
        return kExitFailure;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Unexpected error: ") + e.what());
        return kExitFailure;
    }
}
