#pragma once

#include <istream>
#include <string>
#include <vector>

/**
 * @brief One row of the job table, immutable once parsed
 *
 * Timecodes are kept verbatim (seconds or HH:MM:SS[.fraction]).
 */
struct Job
{
    int row_number = 0; // 1-based over data rows
    std::string source_reference;
    std::string range_start;
    std::string range_end;
    std::string output_name;   // Empty means "use the source identifier"
    std::string output_format; // Lower-cased; empty means "use the run default"

    /**
     * @brief A job needs a source reference and both range ends
     */
    bool isValid() const
    {
        return !source_reference.empty() && !range_start.empty() && !range_end.empty();
    }

    /**
     * @brief Names of the required fields that are empty
     */
    std::vector<std::string> missingFields() const;

    /**
     * @throws ValidationError naming every missing required field
     */
    void validate() const;
};

/**
 * @brief Reads the CSV job table
 *
 * A header row is required. Recognized columns (aliases in parentheses):
 * source_reference (url), range_start (start), range_end (end),
 * output_name (output), output_format (format). The last two are optional.
 */
class JobTableReader
{
public:
    /**
     * @brief Read all data rows of a job table file
     * @throws ConfigurationError if the file is unreadable or required columns are missing
     */
    static std::vector<Job> readFile(const std::string &path);

    /**
     * @brief Read all data rows from a stream
     * @throws ConfigurationError if required columns are missing
     */
    static std::vector<Job> read(std::istream &input);

    /**
     * @brief Split one CSV record into fields, honoring double-quote escaping
     *
     * Quoted fields may contain commas, doubled quotes and line breaks; the
     * stream is advanced past every physical line the record spans.
     *
     * @return false at end of input
     */
    static bool readRecord(std::istream &input, std::vector<std::string> &fields);
};
