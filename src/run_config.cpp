#include "core/run_config.hpp"
#include "core/poco_config_manager.hpp"
#include "core/snippet_errors.hpp"
#include <filesystem>

RunConfig RunConfig::fromConfig(const PocoConfigManager &config)
{
    RunConfig run;
    run.log_level = config.getString("log_level", run.log_level);
    run.output_dir = config.getString("output_dir", run.output_dir);
    run.cache_dir = config.getString("cache_dir", run.cache_dir);
    run.default_format = ClipFormats::normalize(config.getString("default_format", run.default_format));
    run.trim_mode = ClipFormats::normalize(config.getString("trim_mode", run.trim_mode));
    run.precise_bitrate = config.getString("precise_bitrate", run.precise_bitrate);
    run.cookies_file = config.getString("auth.cookies_file", "");
    run.cookies_from_browser = config.getString("auth.cookies_from_browser", "");
    run.soundboard_ready = config.getBool("soundboard.ready", false);
    run.soundboard_config_path = config.getString("soundboard.config_path", "");
    run.layout_rows = config.getInt("soundboard.rows", 0);
    run.layout_cols = config.getInt("soundboard.cols", 0);
    run.ytdlp_program = config.getString("tools.ytdlp", run.ytdlp_program);
    run.ffmpeg_program = config.getString("tools.ffmpeg", run.ffmpeg_program);
    return run;
}

void RunConfig::validate() const
{
    if (!ClipFormats::fromString(default_format))
    {
        std::string names;
        for (const auto &name : ClipFormats::getSupportedNames())
            names += (names.empty() ? "" : ", ") + name;
        throw ConfigurationError("Unsupported default format: " + default_format + " (choose one of " + names + ")");
    }
    if (!ClipFormats::modeFromString(trim_mode))
    {
        throw ConfigurationError("Unknown trim mode: " + trim_mode + " (choose fast or precise)");
    }
    if (output_dir.empty())
    {
        throw ConfigurationError("Output directory must not be empty");
    }
    if (cache_dir.empty())
    {
        throw ConfigurationError("Cache directory must not be empty");
    }
    if (!cookies_file.empty() && !cookies_from_browser.empty())
    {
        throw ConfigurationError("Use either a cookie file or browser cookies, not both");
    }
    if ((layout_rows == 0) != (layout_cols == 0))
    {
        throw ConfigurationError("Soundboard layout needs both rows and cols");
    }
    if (layout_rows < 0 || layout_cols < 0)
    {
        throw ConfigurationError("Soundboard layout rows and cols must be positive");
    }
}

TrimMode RunConfig::getTrimMode() const
{
    return ClipFormats::modeFromString(trim_mode).value_or(TrimMode::FAST);
}

AuthCredential RunConfig::getCredential() const
{
    if (!cookies_file.empty())
        return AuthCredential::cookieFile(cookies_file);
    if (!cookies_from_browser.empty())
        return AuthCredential::browser(cookies_from_browser);
    return AuthCredential::none();
}

std::optional<GridDimensions> RunConfig::getFixedLayout() const
{
    if (layout_rows > 0 && layout_cols > 0)
    {
        GridDimensions dimensions;
        dimensions.rows = layout_rows;
        dimensions.cols = layout_cols;
        return dimensions;
    }
    return std::nullopt;
}

std::string RunConfig::getSoundboardPath() const
{
    if (!soundboard_config_path.empty())
        return soundboard_config_path;
    return (std::filesystem::path(output_dir) / "soundboard.json").string();
}
