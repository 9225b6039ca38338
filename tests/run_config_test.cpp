#include "test_base.hpp"
#include "core/poco_config_manager.hpp"
#include "core/run_config.hpp"
#include "core/snippet_errors.hpp"

class RunConfigTest : public TestBase
{
};

TEST_F(RunConfigTest, DefaultsAreValid)
{
    RunConfig config = RunConfig::fromConfig(PocoConfigManager::getInstance());

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.output_dir, "snippets");
    EXPECT_EQ(config.cache_dir, "downloads");
    EXPECT_EQ(config.default_format, "m4a");
    EXPECT_EQ(config.getTrimMode(), TrimMode::FAST);
    EXPECT_EQ(config.precise_bitrate, "192k");
    EXPECT_EQ(config.getCredential().type, AuthCredential::Type::NONE);
    EXPECT_FALSE(config.getFixedLayout().has_value());
    EXPECT_FALSE(config.wantsSoundboard());
    EXPECT_EQ(config.ytdlp_program, "yt-dlp");
    EXPECT_EQ(config.ffmpeg_program, "ffmpeg");
}

TEST_F(RunConfigTest, FileValuesOverrideDefaultsAndPatchesOverrideFile)
{
    std::string file = createDummyFile("run.json", R"({
        "output_dir": "clips",
        "default_format": "MP3",
        "auth": {"cookies_from_browser": "firefox"},
        "soundboard": {"rows": 4, "cols": 6}
    })");
    auto &manager = PocoConfigManager::getInstance();

    ASSERT_TRUE(manager.load(file));
    manager.update({{"output_dir", "override"}, {"trim_mode", "precise"}});
    RunConfig config = RunConfig::fromConfig(manager);

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.output_dir, "override");
    EXPECT_EQ(config.cache_dir, "downloads");
    EXPECT_EQ(config.default_format, "mp3");
    EXPECT_EQ(config.getTrimMode(), TrimMode::PRECISE);
    EXPECT_EQ(config.getCredential().type, AuthCredential::Type::BROWSER);
    EXPECT_EQ(config.getCredential().value, "firefox");
    ASSERT_TRUE(config.getFixedLayout().has_value());
    EXPECT_EQ(config.getFixedLayout()->rows, 4);
    EXPECT_EQ(config.getFixedLayout()->cols, 6);
}

TEST_F(RunConfigTest, MissingFileIsReportedAndMalformedFileThrows)
{
    auto &manager = PocoConfigManager::getInstance();

    EXPECT_FALSE(manager.load(path("absent.json")));
    EXPECT_THROW(manager.load(createDummyFile("broken.json", "{\"output_dir\": ")), ConfigurationError);
    EXPECT_THROW(manager.load(createDummyFile("list.json", "[1, 2]")), ConfigurationError);
}

TEST_F(RunConfigTest, ResetRestoresDefaults)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"output_dir", "elsewhere"}, {"soundboard", {{"ready", true}}}});

    manager.reset();

    EXPECT_EQ(manager.getString("output_dir", ""), "snippets");
    EXPECT_FALSE(manager.getBool("soundboard.ready", true));
    EXPECT_EQ(manager.getAll()["tools"]["ffmpeg"], "ffmpeg");
}

TEST_F(RunConfigTest, ValidationRejectsBadValues)
{
    RunConfig config;
    config.default_format = "ogg";
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = RunConfig();
    config.trim_mode = "sloppy";
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = RunConfig();
    config.cookies_file = "/tmp/cookies.txt";
    config.cookies_from_browser = "chrome";
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = RunConfig();
    config.layout_rows = 3;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = RunConfig();
    config.layout_rows = -1;
    config.layout_cols = 2;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(RunConfigTest, CookieFileWinsCredentialSelection)
{
    RunConfig config;
    config.cookies_file = "/tmp/cookies.txt";

    EXPECT_EQ(config.getCredential().type, AuthCredential::Type::COOKIE_FILE);
    EXPECT_EQ(config.getCredential().value, "/tmp/cookies.txt");
}

TEST_F(RunConfigTest, SoundboardPathDefaultsIntoOutputDirectory)
{
    RunConfig config;
    config.output_dir = "clips";
    config.soundboard_ready = true;

    EXPECT_TRUE(config.wantsSoundboard());
    EXPECT_EQ(config.getSoundboardPath(), "clips/soundboard.json");

    config.soundboard_config_path = "board.json";
    EXPECT_EQ(config.getSoundboardPath(), "board.json");
}

TEST_F(RunConfigTest, PathValuesAreNotExpanded)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"output_dir", "${HOME}/clips"}, {"auth", {{"cookies_file", "/tmp/${user}.txt"}}}});

    RunConfig config = RunConfig::fromConfig(manager);

    EXPECT_EQ(config.output_dir, "${HOME}/clips");
    EXPECT_EQ(config.cookies_file, "/tmp/${user}.txt");
}

TEST_F(RunConfigTest, SavedConfigurationLoadsBack)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"output_dir", "clips"}, {"soundboard", {{"rows", 3}, {"cols", 4}}}});
    nlohmann::json effective = manager.getAll();
    std::string file = path("effective.json");

    ASSERT_TRUE(manager.save(file));
    manager.reset();
    ASSERT_TRUE(manager.load(file));

    EXPECT_EQ(manager.getAll(), effective);
    EXPECT_EQ(manager.getString("output_dir", ""), "clips");
    EXPECT_EQ(manager.getInt("soundboard.cols", 0), 4);
    EXPECT_FALSE(manager.save(path("missing_dir/effective.json")));
}
