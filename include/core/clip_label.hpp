#pragma once

#include <cstddef>
#include <string>

class ClipLabel
{
public:
    static constexpr size_t kMaxLabelLength = 25;

    /**
     * @brief Turn an output name into a button label
     *
     * "_" and "-" become spaces, runs of blanks collapse and the result is
     * title-cased ("vader-I_am_your_father" -> "Vader I Am Your Father").
     * Labels longer than max_length characters keep their first
     * max_length - 3 characters followed by "...". Lengths count UTF-8 code
     * points, so a multi-byte character is never split. A max_length of 0
     * disables truncation.
     */
    static std::string fromName(const std::string &name, size_t max_length = kMaxLabelLength);

    /**
     * @brief Label for an audio file: its stem, never truncated
     */
    static std::string fromFilePath(const std::string &file_path);

    /**
     * @brief Upper-case every letter that follows a non-letter, lower-case the rest
     *
     * Digits and apostrophes end a word ("track2b" -> "Track2B",
     * "don't" -> "Don'T"). Only ASCII letters change case; multi-byte UTF-8
     * characters pass through untouched and count as letters.
     */
    static std::string titleCase(const std::string &text);

    static size_t countCodePoints(const std::string &text);
};
