#pragma once

#include "core/clip_formats.hpp"
#include "core/process_runner.hpp"
#include <string>
#include <vector>

/**
 * @brief Cuts time ranges out of retrieved media and converts them with ffmpeg
 *
 * trim() always writes the native M4A intermediate next to the final output.
 * convert() then either promotes that file by renaming it (M4A) or
 * re-encodes it to the target format and deletes it.
 */
class TrimEngine
{
public:
    explicit TrimEngine(ProcessRunner &runner, const std::string &ffmpeg_program = "ffmpeg",
                        const std::string &precise_bitrate = "192k");

    /**
     * @brief Throw ConfigurationError if ffmpeg cannot be executed
     */
    void checkAvailable() const;

    /**
     * @brief Cut [start, end] from a media file
     *
     * Timecodes are passed through verbatim; ffmpeg accepts both plain
     * seconds and HH:MM:SS[.fraction].
     *
     * @param input_path Full-length source media
     * @param start Range start timecode
     * @param end Range end timecode
     * @param mode FAST stream-copies, PRECISE re-encodes to AAC
     * @param final_path Final output path; the intermediate is derived from it
     * @return Path of the intermediate file
     * @throws TrimError if ffmpeg fails or produces nothing
     */
    std::string trim(const std::string &input_path, const std::string &start, const std::string &end,
                     TrimMode mode, const std::string &final_path);

    /**
     * @brief Turn an intermediate into the final artifact
     * @param temp_path Intermediate returned by trim()
     * @param final_path Destination; an existing file there is overwritten
     * @param target_format Format name ("m4a", "mp3", "wav")
     * @return final_path
     * @throws ConvertError for an unsupported format or a failed re-encode
     */
    std::string convert(const std::string &temp_path, const std::string &final_path,
                        const std::string &target_format);

    /**
     * @brief "<dir>/<stem>.cut.m4a" for a final output path
     */
    static std::string intermediatePathFor(const std::string &final_path);

    std::vector<std::string> buildTrimCommand(const std::string &input_path, const std::string &start,
                                              const std::string &end, TrimMode mode,
                                              const std::string &output_path) const;
    std::vector<std::string> buildConvertCommand(const std::string &input_path, const std::string &output_path,
                                                 OutputFormat format) const;

private:
    ProcessRunner &runner_;
    std::string ffmpeg_program_;
    std::string precise_bitrate_;
};
