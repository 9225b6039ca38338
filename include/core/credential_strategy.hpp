#pragma once

#include <string>
#include <vector>

/**
 * @brief Run-level authentication selection; at most one source is active
 */
struct AuthCredential
{
    enum class Type
    {
        NONE,
        BROWSER,    // Cookies read from a named browser profile
        COOKIE_FILE // Netscape cookies.txt supplied by the user
    };

    Type type = Type::NONE;
    std::string value; // Browser name or cookie file path

    static AuthCredential none() { return AuthCredential(); }
    static AuthCredential browser(const std::string &name) { return {Type::BROWSER, name}; }
    static AuthCredential cookieFile(const std::string &path) { return {Type::COOKIE_FILE, path}; }

    std::string describe() const;
};

/**
 * @brief One way of authenticating a yt-dlp call
 *
 * A strategy that fails with fallback_on_failure set hands over to the next
 * one in the plan; otherwise its error is final.
 */
struct CredentialStrategy
{
    std::string label;
    std::vector<std::string> args; // Extra yt-dlp arguments, placed before the URL
    bool fallback_on_failure = false;
    std::string failure_hint;      // Logged as a warning when falling back
};

/**
 * @brief Ordered list of credential strategies tried until one succeeds
 */
class CredentialPlan
{
public:
    /**
     * @brief Build the plan for a credential
     *
     * cookie file: [file] with no fallback.
     * browser:     [browser, anonymous], falling back once.
     * none:        [anonymous].
     */
    static CredentialPlan forCredential(const AuthCredential &credential);

    const std::vector<CredentialStrategy> &strategies() const { return strategies_; }
    const AuthCredential &credential() const { return credential_; }

    /**
     * @brief Remediation text emitted when every strategy in the plan failed
     * @return One line per suggested step; empty when no advice applies
     */
    std::vector<std::string> remediationSteps() const;

private:
    AuthCredential credential_;
    std::vector<CredentialStrategy> strategies_;
};
