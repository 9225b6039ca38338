#include "core/batch_orchestrator.hpp"
#include "core/clip_label.hpp"
#include "core/run_config.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

size_t BatchReport::countWith(JobStatus status) const
{
    size_t count = 0;
    for (const auto &outcome : outcomes)
    {
        if (outcome.status == status)
            ++count;
    }
    return count;
}

long long BatchReport::totalProcessingTimeMs() const
{
    long long total = 0;
    for (const auto &outcome : outcomes)
    {
        total += outcome.processing_time_ms;
    }
    return total;
}

std::vector<ClipArtifact> BatchReport::artifacts() const
{
    std::vector<ClipArtifact> clips;
    for (const auto &outcome : outcomes)
    {
        if (outcome.succeeded())
            clips.push_back(outcome.artifact);
    }
    return clips;
}

BatchOptions BatchOptions::fromRunConfig(const RunConfig &config)
{
    BatchOptions options;
    options.output_dir = config.output_dir;
    options.fetch_dir = config.cache_dir;
    options.default_format = config.default_format;
    options.trim_mode = config.getTrimMode();
    options.soundboard_ready = config.soundboard_ready;
    return options;
}

BatchOrchestrator::BatchOrchestrator(const BatchOptions &options, RetrieverGateway &gateway, CacheStore &cache,
                                     TrimEngine &trim_engine, std::function<bool()> cancel_check)
    : options_(options), gateway_(gateway), cache_(cache), trim_engine_(trim_engine),
      cancel_check_(std::move(cancel_check))
{
}

std::string BatchOrchestrator::resolveFormat(const Job &job) const
{
    if (options_.soundboard_ready)
    {
        return ClipFormats::getExtension(OutputFormat::WAV);
    }
    std::string format = ClipFormats::normalize(job.output_format);
    return format.empty() ? ClipFormats::normalize(options_.default_format) : format;
}

std::string BatchOrchestrator::finalPathFor(const std::string &output_name, const std::string &format) const
{
    return (fs::path(options_.output_dir) / (output_name + "." + format)).string();
}

BatchReport BatchOrchestrator::run(const std::vector<Job> &jobs, OutcomeHandler on_outcome)
{
    report_ = BatchReport();
    Logger::info("Processing " + std::to_string(jobs.size()) + " job rows in " +
                 ClipFormats::getModeName(options_.trim_mode) + " mode");

    for (const auto &job : jobs)
    {
        if (cancel_check_ && cancel_check_())
        {
            Logger::warn("Batch interrupted before row " + std::to_string(job.row_number) + "; " +
                         std::to_string(report_.countWith(JobStatus::COMPLETED)) + " clips completed");
            throw InterruptError("Interrupted by user");
        }

        JobOutcome outcome = processJob(job);
        report_.outcomes.push_back(outcome);
        if (on_outcome)
        {
            on_outcome(outcome);
        }
    }

    Logger::info("All jobs processed: " + std::to_string(report_.countWith(JobStatus::COMPLETED)) + " completed, " +
                 std::to_string(report_.countWith(JobStatus::FAILED)) + " failed, " +
                 std::to_string(report_.countWith(JobStatus::SKIPPED)) + " skipped in " +
                 std::to_string(report_.totalProcessingTimeMs()) + " ms");
    return report_;
}

JobOutcome BatchOrchestrator::processJob(const Job &job)
{
    JobOutcome outcome;
    outcome.row_number = job.row_number;
    const std::string row = "Row " + std::to_string(job.row_number);

    try
    {
        job.validate();
    }
    catch (const ValidationError &e)
    {
        Logger::warn(row + " " + e.what() + ". Skipping.");
        outcome.status = JobStatus::SKIPPED;
        outcome.error_kind = e.kind();
        outcome.error_message = e.what();
        return outcome;
    }

    auto started = std::chrono::steady_clock::now();
    try
    {
        outcome.artifact = runPipeline(job, outcome);
        outcome.status = JobStatus::COMPLETED;
    }
    catch (const ConfigurationError &)
    {
        throw;
    }
    catch (const InterruptError &)
    {
        throw;
    }
    catch (const SnippetError &e)
    {
        outcome.status = JobStatus::FAILED;
        outcome.error_kind = e.kind();
        outcome.error_message = e.what();
        Logger::error(row + ": " + e.what());
    }
    catch (const fs::filesystem_error &e)
    {
        outcome.status = JobStatus::FAILED;
        outcome.error_kind = "FilesystemError";
        outcome.error_message = e.what();
        Logger::error(row + ": " + e.what());
    }

    outcome.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
    if (outcome.succeeded())
    {
        Logger::info(row + " done in " + std::to_string(outcome.processing_time_ms) + " ms" +
                     (outcome.cache_hit ? " (cached media)" : ""));
    }
    return outcome;
}

ClipArtifact BatchOrchestrator::runPipeline(const Job &job, JobOutcome &outcome)
{
    std::string format = resolveFormat(job);
    if (!ClipFormats::fromString(format))
    {
        throw ConvertError("Unsupported format: " + format);
    }

    std::string identifier = gateway_.resolveIdentifier(job.source_reference);
    outcome.source_identifier = identifier;

    std::string media_path;
    auto cached = cache_.get(identifier);
    if (cached)
    {
        outcome.cache_hit = true;
        media_path = *cached;
    }
    else
    {
        std::string fetched = gateway_.fetchMedia(job.source_reference, identifier, options_.fetch_dir);
        media_path = cache_.put(identifier, fetched);
    }

    std::string output_name = job.output_name.empty() ? identifier : job.output_name;
    std::string final_path = finalPathFor(output_name, format);
    Logger::info("Processing: " + job.source_reference + " -> " + final_path);

    std::string temp_path = trim_engine_.trim(media_path, job.range_start, job.range_end, options_.trim_mode, final_path);
    trim_engine_.convert(temp_path, final_path, format);
    Logger::info("Wrote " + final_path);

    ClipArtifact artifact;
    std::error_code ec;
    fs::path absolute = fs::absolute(final_path, ec);
    artifact.path = ec ? final_path : absolute.lexically_normal().string();
    artifact.output_name = output_name;
    artifact.label = ClipLabel::fromName(output_name);
    return artifact;
}
