#include "core/retriever_gateway.hpp"
#include "core/clip_formats.hpp"
#include "core/snippet_errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    std::string trimWhitespace(const std::string &text)
    {
        const char *blanks = " \t\r\n";
        size_t begin = text.find_first_not_of(blanks);
        if (begin == std::string::npos)
            return "";
        size_t end = text.find_last_not_of(blanks);
        return text.substr(begin, end - begin + 1);
    }

    std::string describeFailure(const ProcessResult &result)
    {
        std::string detail = "exit code " + std::to_string(result.exit_code);
        std::string err = trimWhitespace(result.stderr_text);
        if (!err.empty())
        {
            // yt-dlp puts the useful line last
            size_t last_newline = err.find_last_of('\n');
            detail += ": " + (last_newline == std::string::npos ? err : err.substr(last_newline + 1));
        }
        return detail;
    }
}

RetrieverGateway::RetrieverGateway(ProcessRunner &runner, const AuthCredential &credential,
                                   const std::string &ytdlp_program, std::function<bool()> cancel_check)
    : runner_(runner), plan_(CredentialPlan::forCredential(credential)), ytdlp_program_(ytdlp_program),
      cancel_check_(std::move(cancel_check))
{
    Logger::debug("RetrieverGateway using " + credential.describe());
}

void RetrieverGateway::checkAvailable() const
{
    if (!runner_.isAvailable(ytdlp_program_))
    {
        throw ConfigurationError(ytdlp_program_ + " not found in PATH. Install yt-dlp and ensure it is on PATH.");
    }
}

template <typename ErrorT>
ProcessResult RetrieverGateway::runWithCredentials(const std::string &operation, const std::vector<std::string> &base_args,
                                                   const std::string &source_reference, bool capture_output)
{
    const auto &strategies = plan_.strategies();
    std::vector<std::string> failures;

    for (size_t i = 0; i < strategies.size(); ++i)
    {
        const CredentialStrategy &strategy = strategies[i];

        std::vector<std::string> args = base_args;
        args.insert(args.end(), strategy.args.begin(), strategy.args.end());
        args.push_back(source_reference);

        ProcessResult result = runner_.run(args, capture_output);
        if (result.succeeded())
        {
            if (i > 0)
            {
                Logger::info(operation + " succeeded " + strategy.label);
            }
            return result;
        }

        failures.push_back(strategy.label + " (" + describeFailure(result) + ")");
        if (result.interruptedBySignal() || (cancel_check_ && cancel_check_()))
        {
            Logger::warn(operation + " interrupted " + strategy.label);
            throw InterruptError("Interrupted by user");
        }

        bool has_next = i + 1 < strategies.size();
        if (strategy.fallback_on_failure && has_next)
        {
            Logger::warn(strategy.failure_hint);
            continue;
        }
        if (!strategy.failure_hint.empty())
        {
            Logger::error(strategy.failure_hint);
        }
        break;
    }

    std::ostringstream message;
    message << operation << " failed for " << source_reference;
    if (failures.size() == 1)
    {
        message << " " << failures.front();
    }
    else
    {
        message << " both with and without cookies:";
        for (const auto &failure : failures)
        {
            message << " [" << failure << "]";
        }
    }

    // A plain anonymous failure carries no credential advice
    std::vector<std::string> steps = plan_.remediationSteps();
    if (failures.size() > 1 || plan_.credential().type == AuthCredential::Type::COOKIE_FILE)
    {
        for (const auto &step : steps)
        {
            Logger::warn("[HELP] " + step);
            message << " " << step;
        }
    }

    throw ErrorT(message.str());
}

std::string RetrieverGateway::resolveIdentifier(const std::string &source_reference)
{
    std::vector<std::string> args = {ytdlp_program_, "--no-playlist", "--get-id"};
    ProcessResult result = runWithCredentials<ResolutionError>("Identifier resolution", args, source_reference, true);

    std::string output = trimWhitespace(result.stdout_text);
    // Only the first line is the identifier; later lines are warnings on some extractors
    size_t newline = output.find('\n');
    std::string identifier = trimWhitespace(newline == std::string::npos ? output : output.substr(0, newline));
    if (identifier.empty())
    {
        throw ResolutionError("yt-dlp returned no identifier for " + source_reference);
    }
    if (identifier.find('/') != std::string::npos)
    {
        throw ResolutionError("yt-dlp returned an unusable identifier '" + identifier + "' for " + source_reference);
    }

    Logger::debug("Resolved " + source_reference + " -> " + identifier);
    return identifier;
}

std::string RetrieverGateway::fetchMedia(const std::string &source_reference, const std::string &identifier,
                                         const std::string &destination_dir)
{
    std::string output_template = (fs::path(destination_dir) / "%(id)s.%(ext)s").string();
    std::vector<std::string> args = {ytdlp_program_, "-x", "--audio-format", ClipFormats::kNativeExtension,
                                     "-o", output_template, "--no-playlist"};

    runWithCredentials<FetchError>("Download", args, source_reference, false);

    fs::path media_path = fs::path(destination_dir) / (identifier + "." + ClipFormats::kNativeExtension);
    std::error_code ec;
    if (!fs::is_regular_file(media_path, ec))
    {
        throw FetchError("yt-dlp reported success but " + media_path.string() + " was not created");
    }

    return media_path.string();
}
