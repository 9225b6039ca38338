#include "core/snippet_batch_runner.hpp"
#include "core/cache_store.hpp"
#include "core/file_utils.hpp"
#include "core/grid_layout_planner.hpp"
#include "core/job_table.hpp"
#include "core/retriever_gateway.hpp"
#include "core/snippet_errors.hpp"
#include "core/soundboard_config.hpp"
#include "core/trim_engine.hpp"
#include "logging/logger.hpp"

SnippetBatchRunner::SnippetBatchRunner(const RunConfig &config, ProcessRunner &runner,
                                       std::function<bool()> cancel_check)
    : config_(config), runner_(runner), cancel_check_(std::move(cancel_check))
{
}

int SnippetBatchRunner::run(const std::string &csv_path)
{
    report_ = BatchReport();
    soundboard_path_.clear();

    try
    {
        execute(csv_path);
        return kExitOk;
    }
    catch (const InterruptError &e)
    {
        Logger::warn(std::string(e.what()) + " after " +
                     std::to_string(report_.countWith(JobStatus::COMPLETED)) + " completed clips");
        return kExitInterrupted;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(e.what());
        return kExitFailure;
    }
    catch (const SnippetError &e)
    {
        Logger::error(std::string(e.kind()) + ": " + e.what());
        return kExitFailure;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Unexpected error: ") + e.what());
        return kExitFailure;
    }
}

void SnippetBatchRunner::execute(const std::string &csv_path)
{
    config_.validate();

    RetrieverGateway gateway(runner_, config_.getCredential(), config_.ytdlp_program, cancel_check_);
    TrimEngine trim_engine(runner_, config_.ffmpeg_program, config_.precise_bitrate);
    gateway.checkAvailable();
    trim_engine.checkAvailable();

    if (!FileUtils::ensureDirectory(config_.output_dir))
    {
        throw ConfigurationError("Cannot create output directory: " + config_.output_dir);
    }
    if (!FileUtils::ensureDirectory(config_.cache_dir))
    {
        throw ConfigurationError("Cannot create cache directory: " + config_.cache_dir);
    }

    std::vector<Job> jobs = JobTableReader::readFile(csv_path);

    FileSystemCacheStore cache(config_.cache_dir, ClipFormats::kNativeExtension);
    BatchOrchestrator orchestrator(BatchOptions::fromRunConfig(config_), gateway, cache, trim_engine,
                                   cancel_check_);
    try
    {
        report_ = orchestrator.run(jobs);
    }
    catch (const InterruptError &)
    {
        report_ = orchestrator.getReport();
        throw;
    }

    if (config_.wantsSoundboard())
    {
        soundboard_path_ = writeSoundboard(config_, report_);
    }
}

std::string SnippetBatchRunner::writeSoundboard(const RunConfig &config, const BatchReport &report)
{
    std::vector<ClipArtifact> clips = report.artifacts();
    if (clips.empty())
    {
        Logger::warn("No clips completed; soundboard configuration not written");
        return "";
    }

    auto fixed = config.getFixedLayout();
    GridLayout layout = fixed ? GridLayoutPlanner::place(clips, *fixed) : GridLayoutPlanner::layout(clips);

    std::string path = config.getSoundboardPath();
    SoundboardConfig::save(SoundboardConfig::fromLayout(layout), path);
    Logger::info("Layout: " + std::to_string(layout.dimensions.rows) + "x" +
                 std::to_string(layout.dimensions.cols) + " with " + std::to_string(layout.cells.size()) +
                 " buttons");
    if (config.soundboard_ready)
    {
        Logger::info("Soundboard ready: " + path);
    }
    return path;
}
