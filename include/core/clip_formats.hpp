#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Output container formats a clip can be written in
 *
 * M4A is the trim engine's native intermediate format, so converting to it
 * is a rename rather than a re-encode.
 */
enum class OutputFormat
{
    M4A,
    MP3,
    WAV
};

/**
 * @brief Trim accuracy/speed trade-off, selected once per run
 */
enum class TrimMode
{
    FAST,   // Stream copy, keyframe-granular boundaries
    PRECISE // AAC re-encode, frame-accurate boundaries
};

class ClipFormats
{
public:
    static constexpr const char *kNativeExtension = "m4a";

    /**
     * @brief Get the file extension for a format
     * @param format Output format
     * @return Extension without the leading dot
     */
    static std::string getExtension(OutputFormat format)
    {
        switch (format)
        {
        case OutputFormat::M4A:
            return "m4a";
        case OutputFormat::MP3:
            return "mp3";
        case OutputFormat::WAV:
            return "wav";
        default:
            return "";
        }
    }

    /**
     * @brief Parse a format name such as "mp3" or "WAV"
     * @param format_str Format name, case-insensitive, surrounding blanks ignored
     * @return The format, or std::nullopt when the name is not recognized
     */
    static std::optional<OutputFormat> fromString(const std::string &format_str)
    {
        std::string name = normalize(format_str);
        if (name == "m4a")
            return OutputFormat::M4A;
        if (name == "mp3")
            return OutputFormat::MP3;
        if (name == "wav")
            return OutputFormat::WAV;
        return std::nullopt;
    }

    static std::vector<std::string> getSupportedNames()
    {
        return {"m4a", "mp3", "wav"};
    }

    static std::string getModeName(TrimMode mode)
    {
        switch (mode)
        {
        case TrimMode::FAST:
            return "fast";
        case TrimMode::PRECISE:
            return "precise";
        default:
            return "unknown";
        }
    }

    static std::optional<TrimMode> modeFromString(const std::string &mode_str)
    {
        std::string name = normalize(mode_str);
        if (name == "fast")
            return TrimMode::FAST;
        if (name == "precise")
            return TrimMode::PRECISE;
        return std::nullopt;
    }

    static std::string normalize(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        std::string result = begin < end ? std::string(begin, end) : std::string();
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }
};
