#include "core/job_table.hpp"
#include "core/clip_formats.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <map>

namespace
{
    std::string trimField(const std::string &value)
    {
        const char *blanks = " \t\r\n";
        size_t begin = value.find_first_not_of(blanks);
        if (begin == std::string::npos)
            return "";
        size_t end = value.find_last_not_of(blanks);
        return value.substr(begin, end - begin + 1);
    }

    // Header aliases mapped to canonical column names
    const std::map<std::string, std::string> kColumnAliases = {
        {"source_reference", "source_reference"},
        {"url", "source_reference"},
        {"range_start", "range_start"},
        {"start", "range_start"},
        {"range_end", "range_end"},
        {"end", "range_end"},
        {"output_name", "output_name"},
        {"output", "output_name"},
        {"output_format", "output_format"},
        {"format", "output_format"}};

    bool isBlankRecord(const std::vector<std::string> &fields)
    {
        for (const auto &field : fields)
        {
            if (!trimField(field).empty())
                return false;
        }
        return true;
    }
}

std::vector<std::string> Job::missingFields() const
{
    std::vector<std::string> missing;
    if (source_reference.empty())
        missing.push_back("source_reference");
    if (range_start.empty())
        missing.push_back("range_start");
    if (range_end.empty())
        missing.push_back("range_end");
    return missing;
}

void Job::validate() const
{
    if (isValid())
        return;
    std::string missing;
    for (const auto &field : missingFields())
        missing += (missing.empty() ? "" : ", ") + field;
    throw ValidationError("missing " + missing);
}

bool JobTableReader::readRecord(std::istream &input, std::vector<std::string> &fields)
{
    fields.clear();
    std::string line;
    if (!std::getline(input, line))
    {
        return false;
    }

    std::string field;
    bool in_quotes = false;

    for (;;)
    {
        for (size_t i = 0; i < line.size(); ++i)
        {
            char c = line[i];
            if (in_quotes)
            {
                if (c == '"')
                {
                    if (i + 1 < line.size() && line[i + 1] == '"')
                    {
                        field += '"';
                        ++i;
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    field += c;
                }
            }
            else if (c == '"')
            {
                in_quotes = true;
            }
            else if (c == ',')
            {
                fields.push_back(field);
                field.clear();
            }
            else if (c != '\r')
            {
                field += c;
            }
        }

        if (!in_quotes)
        {
            break;
        }

        // Quoted field continues on the next physical line
        if (!std::getline(input, line))
        {
            break;
        }
        field += '\n';
    }

    fields.push_back(field);
    return true;
}

std::vector<Job> JobTableReader::read(std::istream &input)
{
    std::vector<std::string> header;
    if (!readRecord(input, header))
    {
        throw ConfigurationError("Job table is empty; a header row is required");
    }

    // Tolerate a UTF-8 byte order mark in front of the first column name
    if (!header.empty() && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0)
    {
        header[0] = header[0].substr(3);
    }

    std::map<std::string, size_t> column_index;
    for (size_t i = 0; i < header.size(); ++i)
    {
        std::string name = ClipFormats::normalize(header[i]);
        auto alias = kColumnAliases.find(name);
        if (alias != kColumnAliases.end() && column_index.count(alias->second) == 0)
        {
            column_index[alias->second] = i;
        }
    }

    std::vector<std::string> missing;
    for (const char *required : {"source_reference", "range_start", "range_end"})
    {
        if (column_index.count(required) == 0)
            missing.push_back(required);
    }
    if (!missing.empty())
    {
        std::string joined;
        for (const auto &name : missing)
            joined += (joined.empty() ? "" : ", ") + name;
        throw ConfigurationError("Job table must include columns: url/source_reference, start/range_start, "
                                 "end/range_end (plus optional output and format). Missing: " +
                                 joined);
    }

    auto value = [&column_index](const std::vector<std::string> &fields, const std::string &column)
    {
        auto it = column_index.find(column);
        if (it == column_index.end() || it->second >= fields.size())
            return std::string();
        return trimField(fields[it->second]);
    };

    std::vector<Job> jobs;
    std::vector<std::string> fields;
    int row_number = 0;
    while (readRecord(input, fields))
    {
        if (isBlankRecord(fields))
        {
            continue;
        }

        Job job;
        job.row_number = ++row_number;
        job.source_reference = value(fields, "source_reference");
        job.range_start = value(fields, "range_start");
        job.range_end = value(fields, "range_end");
        job.output_name = value(fields, "output_name");
        job.output_format = ClipFormats::normalize(value(fields, "output_format"));
        jobs.push_back(job);
    }

    Logger::debug("Read " + std::to_string(jobs.size()) + " job rows");
    return jobs;
}

std::vector<Job> JobTableReader::readFile(const std::string &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open())
    {
        throw ConfigurationError("Job table not found or unreadable: " + path);
    }
    return read(input);
}
