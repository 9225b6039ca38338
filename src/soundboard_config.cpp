#include "core/soundboard_config.hpp"
#include "core/clip_label.hpp"
#include "core/file_utils.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <fstream>

const std::vector<std::string> &SoundboardConfig::defaultExtensions()
{
    static const std::vector<std::string> extensions = {".wav", ".mp3", ".m4a", ".ogg", ".flac"};
    return extensions;
}

nlohmann::json SoundboardConfig::fromLayout(const GridLayout &layout)
{
    nlohmann::json document;
    document["layout"] = {{"rows", layout.dimensions.rows}, {"cols", layout.dimensions.cols}};
    document["buttons"] = nlohmann::json::array();
    for (const auto &cell : layout.cells)
    {
        document["buttons"].push_back({{"file", cell.clip.path},
                                       {"row", cell.row},
                                       {"col", cell.col},
                                       {"label", cell.clip.label}});
    }
    return document;
}

nlohmann::json SoundboardConfig::fromFiles(const std::vector<std::string> &files, bool absolute_paths)
{
    if (files.empty())
    {
        throw ConfigurationError("No audio files to place on the soundboard");
    }

    std::vector<ClipArtifact> clips;
    clips.reserve(files.size());
    for (const auto &file : files)
    {
        ClipArtifact clip;
        clip.path = FileUtils::displayPath(file, absolute_paths);
        clip.output_name = fs::path(file).stem().string();
        clip.label = ClipLabel::fromFilePath(file);
        clips.push_back(clip);
    }
    return fromLayout(GridLayoutPlanner::layout(clips));
}

void SoundboardConfig::validate(const nlohmann::json &document)
{
    if (!document.is_object())
    {
        throw ConfigurationError("Soundboard document must be a JSON object");
    }

    int rows = 0;
    int cols = 0;
    auto layout = document.find("layout");
    if (layout != document.end() && layout->is_object())
    {
        auto r = layout->find("rows");
        auto c = layout->find("cols");
        if (r != layout->end() && r->is_number_integer())
            rows = r->get<int>();
        if (c != layout->end() && c->is_number_integer())
            cols = c->get<int>();
    }
    if (rows <= 0 || cols <= 0)
    {
        throw ConfigurationError("Layout must specify positive integer values for 'rows' and 'cols'");
    }

    auto buttons = document.find("buttons");
    if (buttons == document.end())
    {
        return;
    }
    if (!buttons->is_array())
    {
        throw ConfigurationError("'buttons' must be a list");
    }

    for (size_t index = 0; index < buttons->size(); ++index)
    {
        const auto &button = (*buttons)[index];
        const std::string prefix = "Button " + std::to_string(index) + ": ";
        if (!button.is_object())
        {
            throw ConfigurationError(prefix + "must be an object");
        }
        for (const char *field : {"file", "row", "col"})
        {
            if (!button.contains(field))
            {
                throw ConfigurationError(prefix + "missing required field '" + field + "'");
            }
        }

        if (!button["file"].is_string())
        {
            throw ConfigurationError(prefix + "'file' must be a string");
        }
        std::string file = button["file"].get<std::string>();
        std::error_code ec;
        if (!fs::exists(file, ec))
        {
            throw ConfigurationError(prefix + "audio file not found: " + file);
        }

        if (!button["row"].is_number_integer() || !button["col"].is_number_integer())
        {
            throw ConfigurationError(prefix + "'row' and 'col' must be integers");
        }
        int row = button["row"].get<int>();
        int col = button["col"].get<int>();
        if (row < 1 || row > rows || col < 1 || col > cols)
        {
            throw ConfigurationError(prefix + "position (" + std::to_string(row) + ", " + std::to_string(col) +
                                     ") is outside layout bounds (" + std::to_string(rows) + "x" +
                                     std::to_string(cols) + ")");
        }
    }
}

nlohmann::json SoundboardConfig::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigurationError("Configuration file not found: " + path);
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigurationError(std::string("Invalid JSON in configuration file: ") + e.what());
    }

    validate(document);
    return document;
}

void SoundboardConfig::save(const nlohmann::json &document, const std::string &path)
{
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !FileUtils::ensureDirectory(parent.string()))
    {
        throw ConfigurationError("Cannot create directory for " + path);
    }

    std::ofstream out(path);
    if (!out.is_open())
    {
        throw ConfigurationError("Cannot write soundboard configuration: " + path);
    }
    out << document.dump(2) << "\n";
    if (!out)
    {
        throw ConfigurationError("Failed writing soundboard configuration: " + path);
    }
    Logger::info("Soundboard configuration saved to: " + path);
}
