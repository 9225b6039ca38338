#pragma once

#include "core/credential_strategy.hpp"
#include "core/process_runner.hpp"
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Wraps yt-dlp for identifier resolution and audio retrieval
 *
 * Both operations run through the same CredentialPlan: a cookie file is used
 * exclusively, browser cookies fall back once to an anonymous attempt, and
 * with no credential a single anonymous attempt is made. The fallback is
 * abandoned with InterruptError when the failed attempt was killed by
 * SIGINT/SIGTERM or the cancellation check fires.
 */
class RetrieverGateway
{
public:
    RetrieverGateway(ProcessRunner &runner, const AuthCredential &credential,
                     const std::string &ytdlp_program = "yt-dlp", std::function<bool()> cancel_check = nullptr);

    /**
     * @brief Throw ConfigurationError if yt-dlp cannot be executed
     */
    void checkAvailable() const;

    /**
     * @brief Resolve a source reference (URL) to its platform identifier
     * @param source_reference User-supplied locator
     * @return Stable identifier, e.g. a video ID
     * @throws ResolutionError when every credential strategy failed
     * @throws InterruptError when interrupted before the fallback attempt
     */
    std::string resolveIdentifier(const std::string &source_reference);

    /**
     * @brief Download the full-length audio of a source into a directory
     * @param source_reference User-supplied locator
     * @param identifier Identifier returned by resolveIdentifier()
     * @param destination_dir Directory receiving "<identifier>.m4a"
     * @return Path of the retrieved media file
     * @throws FetchError when every credential strategy failed or no file appeared
     */
    std::string fetchMedia(const std::string &source_reference, const std::string &identifier,
                           const std::string &destination_dir);

private:
    template <typename ErrorT>
    ProcessResult runWithCredentials(const std::string &operation, const std::vector<std::string> &base_args,
                                     const std::string &source_reference, bool capture_output);

    ProcessRunner &runner_;
    CredentialPlan plan_;
    std::string ytdlp_program_;
    std::function<bool()> cancel_check_;
};
