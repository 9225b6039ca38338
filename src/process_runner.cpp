#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace
{
    std::string quoteArgument(const std::string &arg)
    {
        if (arg.empty())
        {
            return "''";
        }

        bool needs_quotes = false;
        for (char c : arg)
        {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || std::strchr("@%+=:,./-_", c) != nullptr))
            {
                needs_quotes = true;
                break;
            }
        }
        if (!needs_quotes)
        {
            return arg;
        }

        std::string quoted = "'";
        for (char c : arg)
        {
            if (c == '\'')
                quoted += "'\"'\"'";
            else
                quoted += c;
        }
        quoted += "'";
        return quoted;
    }

    // Closes whichever pipe ends are still open on scope exit
    struct PipePair
    {
        int fds[2] = {-1, -1};

        ~PipePair()
        {
            closeRead();
            closeWrite();
        }

        bool open() { return pipe(fds) == 0; }
        void closeRead()
        {
            if (fds[0] >= 0)
            {
                close(fds[0]);
                fds[0] = -1;
            }
        }
        void closeWrite()
        {
            if (fds[1] >= 0)
            {
                close(fds[1]);
                fds[1] = -1;
            }
        }
    };

    void drainPipes(int out_fd, int err_fd, std::string &out, std::string &err)
    {
        struct pollfd fds[2];
        fds[0] = {out_fd, POLLIN, 0};
        fds[1] = {err_fd, POLLIN, 0};
        int open_count = 2;
        char buffer[4096];

        while (open_count > 0)
        {
            int ready = poll(fds, 2, -1);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                Logger::warn(std::string("poll() failed while reading child output: ") + std::strerror(errno));
                return;
            }

            for (int i = 0; i < 2; ++i)
            {
                if (fds[i].fd < 0 || fds[i].revents == 0)
                    continue;

                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0)
                {
                    (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN))
                {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
}

std::string ProcessRunner::formatCommand(const std::vector<std::string> &args)
{
    std::ostringstream oss;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
            oss << ' ';
        oss << quoteArgument(args[i]);
    }
    return oss.str();
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &args, bool capture_output)
{
    if (args.empty())
    {
        return ProcessResult(-1, "", "empty command");
    }

    Logger::info("Running: " + formatCommand(args));

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    PipePair out_pipe;
    PipePair err_pipe;
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    if (capture_output)
    {
        if (!out_pipe.open() || !err_pipe.open())
        {
            posix_spawn_file_actions_destroy(&actions);
            return ProcessResult(-1, "", std::string("pipe() failed: ") + std::strerror(errno));
        }
        posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);
        posix_spawn_file_actions_addclose(&actions, out_pipe.fds[0]);
        posix_spawn_file_actions_addclose(&actions, err_pipe.fds[0]);
        posix_spawn_file_actions_addclose(&actions, out_pipe.fds[1]);
        posix_spawn_file_actions_addclose(&actions, err_pipe.fds[1]);
    }

    pid_t pid = 0;
    int spawn_rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (spawn_rc != 0)
    {
        std::string message = "Failed to start " + args[0] + ": " + std::strerror(spawn_rc);
        Logger::error(message);
        return ProcessResult(127, "", message);
    }

    ProcessResult result;
    if (capture_output)
    {
        out_pipe.closeWrite();
        err_pipe.closeWrite();
        drainPipes(out_pipe.fds[0], err_pipe.fds[0], result.stdout_text, result.stderr_text);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            result.exit_code = -1;
            result.stderr_text += std::string("waitpid() failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.exit_code = 128 + WTERMSIG(status);
    }
    else
    {
        result.exit_code = -1;
    }

    if (result.exit_code != 0)
    {
        Logger::debug(args[0] + " exited with code " + std::to_string(result.exit_code));
    }
    return result;
}

bool PosixProcessRunner::isAvailable(const std::string &program) const
{
    if (program.empty())
    {
        return false;
    }

    if (program.find('/') != std::string::npos)
    {
        return access(program.c_str(), X_OK) == 0 && !std::filesystem::is_directory(program);
    }

    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr)
    {
        return false;
    }

    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':'))
    {
        if (dir.empty())
            dir = ".";
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
        {
            return true;
        }
    }
    return false;
}
