#pragma once

#include "core/cache_store.hpp"
#include "core/clip_formats.hpp"
#include "core/grid_layout_planner.hpp"
#include "core/job_table.hpp"
#include "core/retriever_gateway.hpp"
#include "core/trim_engine.hpp"
#include <functional>
#include <string>
#include <vector>

struct RunConfig;

enum class JobStatus
{
    COMPLETED,
    SKIPPED, // Required fields missing; nothing was attempted
    FAILED   // A pipeline stage raised its error kind
};

/**
 * @brief What happened to one job row
 */
struct JobOutcome
{
    int row_number = 0;
    JobStatus status = JobStatus::FAILED;
    std::string error_kind;
    std::string error_message;
    std::string source_identifier;
    bool cache_hit = false;
    long long processing_time_ms = 0;
    ClipArtifact artifact; // Set only when COMPLETED

    bool succeeded() const { return status == JobStatus::COMPLETED; }
};

struct BatchReport
{
    std::vector<JobOutcome> outcomes;

    size_t countWith(JobStatus status) const;
    long long totalProcessingTimeMs() const;

    // Completed clips in completion order
    std::vector<ClipArtifact> artifacts() const;
};

struct BatchOptions
{
    std::string output_dir = "snippets";
    std::string fetch_dir = "downloads"; // Where retrieved media lands before it is cached
    std::string default_format = "m4a";
    TrimMode trim_mode = TrimMode::FAST;
    bool soundboard_ready = false; // Every clip is written as wav

    static BatchOptions fromRunConfig(const RunConfig &config);
};

/**
 * @brief Runs job rows one at a time through resolve, fetch, trim and convert
 *
 * Error Handling Policy:
 * - A row missing a required field is SKIPPED with a warning.
 * - Resolution, fetch, trim, convert and validation errors mark the row FAILED,
 *   are logged with its row number, and the batch moves on.
 * - The cancellation check runs before every job; once it returns true the
 *   batch stops with InterruptError. Completed work stays on disk and in
 *   getReport().
 */
class BatchOrchestrator
{
public:
    using OutcomeHandler = std::function<void(const JobOutcome &)>;

    BatchOrchestrator(const BatchOptions &options, RetrieverGateway &gateway, CacheStore &cache,
                      TrimEngine &trim_engine, std::function<bool()> cancel_check = nullptr);

    /**
     * @brief Process every job in order
     * @param on_outcome Called after each job settles
     * @throws InterruptError when cancelled between jobs
     */
    BatchReport run(const std::vector<Job> &jobs, OutcomeHandler on_outcome = nullptr);

    /**
     * @brief Process a single job; never throws a per-job error kind
     */
    JobOutcome processJob(const Job &job);

    // Outcomes recorded so far, including those of an interrupted run
    const BatchReport &getReport() const { return report_; }

    std::string resolveFormat(const Job &job) const;
    std::string finalPathFor(const std::string &output_name, const std::string &format) const;

private:
    ClipArtifact runPipeline(const Job &job, JobOutcome &outcome);

    BatchOptions options_;
    RetrieverGateway &gateway_;
    CacheStore &cache_;
    TrimEngine &trim_engine_;
    std::function<bool()> cancel_check_;
    BatchReport report_;
};
