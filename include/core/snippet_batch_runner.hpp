#pragma once

#include "core/batch_orchestrator.hpp"
#include "core/process_runner.hpp"
#include "core/run_config.hpp"
#include <functional>
#include <string>

/**
 * @brief One complete snippet_batch run, from job table to soundboard
 *
 * Startup checks (configuration, tools, directories, job table) all happen
 * before the first row is processed. Exit codes:
 * - kExitOk when every row was attempted, even if some failed or were skipped
 * - kExitFailure for a configuration or startup problem
 * - kExitInterrupted when the run was cancelled
 */
class SnippetBatchRunner
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitInterrupted = 130;

    SnippetBatchRunner(const RunConfig &config, ProcessRunner &runner, std::function<bool()> cancel_check = nullptr);

    /**
     * @brief Process the job table and write the soundboard document if one is wanted
     * @return Process exit code
     */
    int run(const std::string &csv_path);

    // Outcomes of the last run, including an interrupted one
    const BatchReport &getReport() const { return report_; }

    // Soundboard document written by the last run; empty when none was written
    const std::string &getSoundboardPath() const { return soundboard_path_; }

    /**
     * @brief Lay out the completed clips and save the document
     *
     * A fixed layout keeps the first rows * cols clips; otherwise the grid is
     * computed from the clip count.
     *
     * @return Path written, or empty when no clip completed
     */
    static std::string writeSoundboard(const RunConfig &config, const BatchReport &report);

private:
    void execute(const std::string &csv_path);

    RunConfig config_;
    ProcessRunner &runner_;
    std::function<bool()> cancel_check_;
    BatchReport report_;
    std::string soundboard_path_;
};
