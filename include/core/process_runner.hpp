#pragma once

#include <csignal>
#include <string>
#include <vector>

/**
 * @brief Outcome of one external command invocation
 */
struct ProcessResult
{
    int exit_code;
    std::string stdout_text;
    std::string stderr_text;

    ProcessResult() : exit_code(-1) {}
    ProcessResult(int code, const std::string &out = "", const std::string &err = "")
        : exit_code(code), stdout_text(out), stderr_text(err) {}

    bool succeeded() const { return exit_code == 0; }

    // A child killed by signal N reports 128 + N
    bool interruptedBySignal() const { return exit_code == 128 + SIGINT || exit_code == 128 + SIGTERM; }
};

/**
 * @brief Seam through which yt-dlp and ffmpeg are invoked
 *
 * Calls block until the child exits. No timeout is enforced here; the
 * invoked tool's own timeout and cancellation behavior applies.
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run a command given as an argument vector (argv[0] is the program)
     * @param args Program followed by its arguments; never passed through a shell
     * @param capture_output Capture stdout/stderr instead of inheriting the terminal
     * @return ProcessResult with the exit code and any captured text
     */
    virtual ProcessResult run(const std::vector<std::string> &args, bool capture_output) = 0;

    /**
     * @brief Check whether a program can be executed
     * @param program Bare name looked up on PATH, or an explicit path
     */
    virtual bool isAvailable(const std::string &program) const = 0;

    /**
     * @brief Render an argument vector as a shell-quoted command line for logging
     */
    static std::string formatCommand(const std::vector<std::string> &args);
};

/**
 * @brief ProcessRunner backed by posix_spawnp, pipes and waitpid
 */
class PosixProcessRunner : public ProcessRunner
{
public:
    ProcessResult run(const std::vector<std::string> &args, bool capture_output) override;
    bool isAvailable(const std::string &program) const override;
};
