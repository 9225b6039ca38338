#include "core/clip_label.hpp"
#include <cctype>
#include <filesystem>
#include <sstream>

namespace
{
    bool isContinuationByte(unsigned char c)
    {
        return (c & 0xC0) == 0x80;
    }

    // Byte offset where the code point with the given index starts
    size_t offsetOfCodePoint(const std::string &text, size_t index)
    {
        size_t seen = 0;
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (isContinuationByte(static_cast<unsigned char>(text[i])))
                continue;
            if (seen == index)
                return i;
            ++seen;
        }
        return text.size();
    }
}

size_t ClipLabel::countCodePoints(const std::string &text)
{
    size_t count = 0;
    for (char c : text)
    {
        if (!isContinuationByte(static_cast<unsigned char>(c)))
            ++count;
    }
    return count;
}

std::string ClipLabel::titleCase(const std::string &text)
{
    std::string result = text;
    bool previous_cased = false;
    for (char &c : result)
    {
        unsigned char byte = static_cast<unsigned char>(c);
        if (std::isalpha(byte))
        {
            c = static_cast<char>(previous_cased ? std::tolower(byte) : std::toupper(byte));
            previous_cased = true;
        }
        else
        {
            // Multi-byte characters are left as they are but still count as letters
            previous_cased = byte >= 0x80;
        }
    }
    return result;
}

std::string ClipLabel::fromName(const std::string &name, size_t max_length)
{
    std::string spaced = name;
    for (char &c : spaced)
    {
        if (c == '_' || c == '-')
            c = ' ';
    }

    std::istringstream words(spaced);
    std::string word;
    std::string label;
    while (words >> word)
    {
        if (!label.empty())
            label += ' ';
        label += word;
    }
    label = titleCase(label);

    if (max_length > 3 && countCodePoints(label) > max_length)
    {
        label = label.substr(0, offsetOfCodePoint(label, max_length - 3)) + "...";
    }
    return label;
}

std::string ClipLabel::fromFilePath(const std::string &file_path)
{
    return fromName(std::filesystem::path(file_path).stem().string(), 0);
}
