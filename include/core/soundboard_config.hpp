#pragma once

#include "core/grid_layout_planner.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief The soundboard document read by the playback front end
 *
 * Shape: {"layout": {"rows", "cols"}, "buttons": [{"file", "row", "col", "label"}]}
 */
class SoundboardConfig
{
public:
    /**
     * @brief Extensions picked up by a folder scan when none are added
     */
    static const std::vector<std::string> &defaultExtensions();

    /**
     * @brief One button per placed cell; file paths are taken as given
     */
    static nlohmann::json fromLayout(const GridLayout &layout);

    /**
     * @brief Document for a list of audio files, laid out with a computed grid
     *
     * Labels come from the file stems. Paths are relative to the current
     * directory where possible unless absolute_paths is set.
     *
     * @throws ConfigurationError if files is empty
     */
    static nlohmann::json fromFiles(const std::vector<std::string> &files, bool absolute_paths);

    /**
     * @brief Check layout bounds, required button fields and that files exist
     * @throws ConfigurationError naming the offending button index
     */
    static void validate(const nlohmann::json &document);

    /**
     * @brief Parse and validate a document on disk
     * @throws ConfigurationError if the file is missing, not JSON or invalid
     */
    static nlohmann::json load(const std::string &path);

    /**
     * @brief Write a document indented by 2
     * @throws ConfigurationError if the file cannot be written
     */
    static void save(const nlohmann::json &document, const std::string &path);
};
