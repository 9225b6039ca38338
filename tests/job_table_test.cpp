#include "test_base.hpp"
#include "core/job_table.hpp"
#include "core/snippet_errors.hpp"
#include <sstream>

class JobTableTest : public TestBase
{
};

TEST_F(JobTableTest, ReadsShortColumnNames)
{
    std::istringstream csv("url,start,end,output,format\n"
                           "https://example.com/watch?v=abc,00:00:05,00:00:09,intro,MP3\n"
                           "https://example.com/watch?v=def,12,14.5,,\n");

    auto jobs = JobTableReader::read(csv);

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].row_number, 1);
    EXPECT_EQ(jobs[0].source_reference, "https://example.com/watch?v=abc");
    EXPECT_EQ(jobs[0].range_start, "00:00:05");
    EXPECT_EQ(jobs[0].range_end, "00:00:09");
    EXPECT_EQ(jobs[0].output_name, "intro");
    EXPECT_EQ(jobs[0].output_format, "mp3");

    EXPECT_EQ(jobs[1].row_number, 2);
    EXPECT_EQ(jobs[1].range_end, "14.5");
    EXPECT_TRUE(jobs[1].output_name.empty());
    EXPECT_TRUE(jobs[1].output_format.empty());
}

TEST_F(JobTableTest, ReadsLongColumnNamesInAnyOrder)
{
    std::istringstream csv("range_end,output_format,source_reference,range_start,output_name\n"
                           "9,wav,https://example.com/a,5,clip\n");

    auto jobs = JobTableReader::read(csv);

    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].source_reference, "https://example.com/a");
    EXPECT_EQ(jobs[0].range_start, "5");
    EXPECT_EQ(jobs[0].range_end, "9");
    EXPECT_EQ(jobs[0].output_name, "clip");
    EXPECT_EQ(jobs[0].output_format, "wav");
}

TEST_F(JobTableTest, MissingRequiredColumnIsConfigurationError)
{
    std::istringstream csv("url,start,output\nhttps://example.com/a,5,clip\n");

    try
    {
        JobTableReader::read(csv);
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError &e)
    {
        EXPECT_NE(std::string(e.what()).find("range_end"), std::string::npos);
    }
}

TEST_F(JobTableTest, EmptyInputIsConfigurationError)
{
    std::istringstream csv("");
    EXPECT_THROW(JobTableReader::read(csv), ConfigurationError);
}

TEST_F(JobTableTest, MissingFileIsConfigurationError)
{
    EXPECT_THROW(JobTableReader::readFile(path("does_not_exist.csv")), ConfigurationError);
}

TEST_F(JobTableTest, QuotedFieldsKeepCommasQuotesAndLineBreaks)
{
    std::istringstream csv("url,start,end,output\n"
                           "\"https://example.com/a?x=1,2\",1,2,\"say \"\"hi\"\"\"\n"
                           "https://example.com/b,3,4,\"two\nlines\"\n");

    auto jobs = JobTableReader::read(csv);

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].source_reference, "https://example.com/a?x=1,2");
    EXPECT_EQ(jobs[0].output_name, "say \"hi\"");
    EXPECT_EQ(jobs[1].output_name, "two\nlines");
    EXPECT_EQ(jobs[1].row_number, 2);
}

TEST_F(JobTableTest, BomCrlfAndBlankLinesAreTolerated)
{
    std::istringstream csv("\xEF\xBB\xBFurl,start,end\r\n"
                           "\r\n"
                           "  https://example.com/a , 1 , 2 \r\n"
                           ",,\r\n"
                           "https://example.com/b,3,4\r\n");

    auto jobs = JobTableReader::read(csv);

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].source_reference, "https://example.com/a");
    EXPECT_EQ(jobs[0].range_start, "1");
    EXPECT_EQ(jobs[0].range_end, "2");
    EXPECT_EQ(jobs[1].row_number, 2);
}

TEST_F(JobTableTest, IncompleteRowsAreReadButInvalid)
{
    std::istringstream csv("url,start,end\n"
                           "https://example.com/a,1\n"
                           ",1,2\n");

    auto jobs = JobTableReader::read(csv);

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_FALSE(jobs[0].isValid());
    EXPECT_EQ(jobs[0].missingFields(), std::vector<std::string>({"range_end"}));
    EXPECT_FALSE(jobs[1].isValid());
    EXPECT_EQ(jobs[1].missingFields(), std::vector<std::string>({"source_reference"}));
}

TEST_F(JobTableTest, ReadFileParsesFromDisk)
{
    std::string file = createDummyFile("jobs.csv", "url,start,end\nhttps://example.com/a,1,2\n");

    auto jobs = JobTableReader::readFile(file);

    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_TRUE(jobs[0].isValid());
}

TEST_F(JobTableTest, ValidateNamesEveryMissingField)
{
    Job job;
    job.range_start = "1";

    try
    {
        job.validate();
        FAIL() << "Expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        EXPECT_STREQ(e.what(), "missing source_reference, range_end");
        EXPECT_STREQ(e.kind(), "ValidationError");
    }

    job.source_reference = "https://example.com/a";
    job.range_end = "2";
    EXPECT_NO_THROW(job.validate());
}
