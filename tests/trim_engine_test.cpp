#include "test_base.hpp"
#include "stubs/scripted_process_runner.hpp"
#include "core/trim_engine.hpp"
#include "core/snippet_errors.hpp"

namespace
{
    bool reencodes(const std::vector<std::string> &args)
    {
        return ScriptedProcessRunner::hasArg(args, "-c:a");
    }
}

class TrimEngineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        source_ = createDummyFile("downloads/abc.m4a", "media");
    }

    ScriptedProcessRunner runner_;
    std::string source_;
};

TEST_F(TrimEngineTest, IntermediateSitsNextToFinalOutput)
{
    EXPECT_EQ(TrimEngine::intermediatePathFor("/out/intro.wav"), "/out/intro.cut.m4a");
    EXPECT_EQ(TrimEngine::intermediatePathFor("/out/intro.m4a"), "/out/intro.cut.m4a");
}

TEST_F(TrimEngineTest, FastModeCopiesStreams)
{
    TrimEngine engine(runner_);

    std::string temp = engine.trim(source_, "00:00:05", "00:00:09", TrimMode::FAST, path("out/intro.m4a"));

    EXPECT_EQ(temp, path("out/intro.cut.m4a"));
    ASSERT_EQ(runner_.calls.size(), 1u);
    const auto &args = runner_.calls[0];
    EXPECT_EQ(ScriptedProcessRunner::argAfter(args, "-c"), "copy");
    EXPECT_FALSE(reencodes(args));
    EXPECT_EQ(ScriptedProcessRunner::argAfter(args, "-ss"), "00:00:05");
    EXPECT_EQ(ScriptedProcessRunner::argAfter(args, "-to"), "00:00:09");
    EXPECT_EQ(ScriptedProcessRunner::argAfter(args, "-i"), source_);
}

TEST_F(TrimEngineTest, PreciseModeAlwaysReencodes)
{
    TrimEngine engine(runner_, "ffmpeg", "256k");

    for (const std::string format : {"m4a", "mp3", "wav"})
    {
        runner_.calls.clear();
        std::string final_path = path("out/clip." + format);
        std::string temp = engine.trim(source_, "1", "2", TrimMode::PRECISE, final_path);

        ASSERT_FALSE(runner_.calls.empty());
        EXPECT_EQ(ScriptedProcessRunner::argAfter(runner_.calls[0], "-c:a"), "aac");
        EXPECT_EQ(ScriptedProcessRunner::argAfter(runner_.calls[0], "-b:a"), "256k");
        EXPECT_FALSE(ScriptedProcessRunner::hasArg(runner_.calls[0], "copy"));
        engine.convert(temp, final_path, format);
    }
}

TEST_F(TrimEngineTest, NativeFormatIsPromotedByRename)
{
    TrimEngine engine(runner_);
    std::string final_path = createDummyFile("out/intro.m4a", "old take");
    std::string temp = engine.trim(source_, "1", "2", TrimMode::FAST, final_path);
    std::string trimmed = readFile(temp);
    runner_.calls.clear();

    engine.convert(temp, final_path, "m4a");

    EXPECT_TRUE(runner_.calls.empty());
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_EQ(readFile(final_path), trimmed);
}

TEST_F(TrimEngineTest, OtherFormatsReencodeAndRemoveIntermediate)
{
    TrimEngine engine(runner_);

    for (const std::string format : {"mp3", "wav"})
    {
        std::string final_path = path("out/intro." + format);
        std::string temp = engine.trim(source_, "1", "2", TrimMode::FAST, final_path);
        runner_.calls.clear();

        EXPECT_EQ(engine.convert(temp, final_path, format), final_path);

        ASSERT_EQ(runner_.calls.size(), 1u);
        EXPECT_EQ(ScriptedProcessRunner::argAfter(runner_.calls[0], "-i"), temp);
        EXPECT_EQ(runner_.calls[0].back(), final_path);
        EXPECT_EQ(ScriptedProcessRunner::hasArg(runner_.calls[0], "-q:a"), format == "mp3");
        EXPECT_TRUE(std::filesystem::exists(final_path));
        EXPECT_FALSE(std::filesystem::exists(temp));
    }
}

TEST_F(TrimEngineTest, UnsupportedFormatIsConvertError)
{
    TrimEngine engine(runner_);
    std::string temp = engine.trim(source_, "1", "2", TrimMode::FAST, path("out/intro.ogg"));
    runner_.calls.clear();

    EXPECT_THROW(engine.convert(temp, path("out/intro.ogg"), "ogg"), ConvertError);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(TrimEngineTest, FailedTrimIsTrimError)
{
    runner_.should_fail = [](const std::vector<std::string> &)
    { return true; };
    TrimEngine engine(runner_);

    EXPECT_THROW(engine.trim(source_, "1", "2", TrimMode::FAST, path("out/intro.m4a")), TrimError);
}

TEST_F(TrimEngineTest, FailedConversionIsConvertError)
{
    TrimEngine engine(runner_);
    std::string temp = engine.trim(source_, "1", "2", TrimMode::FAST, path("out/intro.mp3"));
    runner_.should_fail = [](const std::vector<std::string> &)
    { return true; };

    EXPECT_THROW(engine.convert(temp, path("out/intro.mp3"), "mp3"), ConvertError);
}

TEST_F(TrimEngineTest, MissingFfmpegIsConfigurationError)
{
    runner_.unavailable.insert("ffmpeg");
    TrimEngine engine(runner_);

    EXPECT_THROW(engine.checkAvailable(), ConfigurationError);
}
