#pragma once

#include "core/clip_formats.hpp"
#include "core/credential_strategy.hpp"
#include "core/grid_layout_planner.hpp"
#include <optional>
#include <string>

class PocoConfigManager;

/**
 * @brief Validated snapshot of the configuration for one batch run
 */
struct RunConfig
{
    std::string log_level = "INFO";
    std::string output_dir = "snippets";
    std::string cache_dir = "downloads";
    std::string default_format = "m4a";
    std::string trim_mode = "fast";
    std::string precise_bitrate = "192k";

    std::string cookies_file;
    std::string cookies_from_browser;

    bool soundboard_ready = false;      // Force wav output and write a soundboard document
    std::string soundboard_config_path; // Empty: "<output_dir>/soundboard.json" when a document is wanted
    int layout_rows = 0;                // 0 and 0: compute the grid from the clip count
    int layout_cols = 0;

    std::string ytdlp_program = "yt-dlp";
    std::string ffmpeg_program = "ffmpeg";

    static RunConfig fromConfig(const PocoConfigManager &config);

    /**
     * @brief Reject settings the batch cannot run with
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    TrimMode getTrimMode() const;
    AuthCredential getCredential() const;

    // Fixed dimensions if both were configured
    std::optional<GridDimensions> getFixedLayout() const;

    bool wantsSoundboard() const { return soundboard_ready || !soundboard_config_path.empty(); }
    std::string getSoundboardPath() const;
};
