#include "core/trim_engine.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

TrimEngine::TrimEngine(ProcessRunner &runner, const std::string &ffmpeg_program, const std::string &precise_bitrate)
    : runner_(runner), ffmpeg_program_(ffmpeg_program), precise_bitrate_(precise_bitrate)
{
}

void TrimEngine::checkAvailable() const
{
    if (!runner_.isAvailable(ffmpeg_program_))
    {
        throw ConfigurationError(ffmpeg_program_ + " not found in PATH. Install it and ensure it's on PATH.");
    }
}

std::string TrimEngine::intermediatePathFor(const std::string &final_path)
{
    fs::path path(final_path);
    path.replace_extension(std::string(".cut.") + ClipFormats::kNativeExtension);
    return path.string();
}

std::vector<std::string> TrimEngine::buildTrimCommand(const std::string &input_path, const std::string &start,
                                                      const std::string &end, TrimMode mode,
                                                      const std::string &output_path) const
{
    std::vector<std::string> args = {ffmpeg_program_, "-hide_banner", "-y",
                                     "-ss", start, "-to", end,
                                     "-i", input_path};
    if (mode == TrimMode::PRECISE)
    {
        args.insert(args.end(), {"-c:a", "aac", "-b:a", precise_bitrate_});
    }
    else
    {
        args.insert(args.end(), {"-c", "copy"});
    }
    args.push_back(output_path);
    return args;
}

std::vector<std::string> TrimEngine::buildConvertCommand(const std::string &input_path, const std::string &output_path,
                                                         OutputFormat format) const
{
    std::vector<std::string> args = {ffmpeg_program_, "-hide_banner", "-y", "-i", input_path};
    if (format == OutputFormat::MP3)
    {
        args.insert(args.end(), {"-q:a", "2"});
    }
    args.push_back(output_path);
    return args;
}

std::string TrimEngine::trim(const std::string &input_path, const std::string &start, const std::string &end,
                             TrimMode mode, const std::string &final_path)
{
    std::string temp_path = intermediatePathFor(final_path);
    Logger::debug("Trimming " + input_path + " [" + start + " -> " + end + "] in " +
                  ClipFormats::getModeName(mode) + " mode");

    ProcessResult result = runner_.run(buildTrimCommand(input_path, start, end, mode, temp_path), false);
    if (!result.succeeded())
    {
        throw TrimError("ffmpeg trim failed with exit code " + std::to_string(result.exit_code));
    }

    std::error_code ec;
    if (!fs::is_regular_file(temp_path, ec))
    {
        throw TrimError("ffmpeg reported success but " + temp_path + " was not created");
    }
    return temp_path;
}

std::string TrimEngine::convert(const std::string &temp_path, const std::string &final_path,
                                const std::string &target_format)
{
    auto format = ClipFormats::fromString(target_format);
    if (!format)
    {
        throw ConvertError("Unsupported format: " + target_format);
    }

    std::error_code ec;
    if (*format == OutputFormat::M4A)
    {
        // Already in the native format; promote the intermediate
        if (fs::exists(final_path, ec))
        {
            fs::remove(final_path, ec);
            if (ec)
            {
                throw ConvertError("Cannot replace existing " + final_path + ": " + ec.message());
            }
        }
        fs::rename(temp_path, final_path, ec);
        if (ec)
        {
            throw ConvertError("Cannot rename " + temp_path + " to " + final_path + ": " + ec.message());
        }
        return final_path;
    }

    ProcessResult result = runner_.run(buildConvertCommand(temp_path, final_path, *format), false);
    if (!result.succeeded())
    {
        throw ConvertError("ffmpeg conversion to " + ClipFormats::getExtension(*format) +
                           " failed with exit code " + std::to_string(result.exit_code));
    }
    if (!fs::is_regular_file(final_path, ec))
    {
        throw ConvertError("ffmpeg reported success but " + final_path + " was not created");
    }

    fs::remove(temp_path, ec);
    if (ec)
    {
        Logger::warn("Failed to remove intermediate " + temp_path + ": " + ec.message());
    }
    return final_path;
}
