#include "core/credential_strategy.hpp"

std::string AuthCredential::describe() const
{
    switch (type)
    {
    case Type::BROWSER:
        return "cookies from browser '" + value + "'";
    case Type::COOKIE_FILE:
        return "cookie file '" + value + "'";
    case Type::NONE:
    default:
        return "no credentials";
    }
}

CredentialPlan CredentialPlan::forCredential(const AuthCredential &credential)
{
    CredentialPlan plan;
    plan.credential_ = credential;

    CredentialStrategy anonymous;
    anonymous.label = "without cookies";

    switch (credential.type)
    {
    case AuthCredential::Type::COOKIE_FILE:
    {
        CredentialStrategy file;
        file.label = "with cookie file " + credential.value;
        file.args = {"--cookies", credential.value};
        file.fallback_on_failure = false;
        file.failure_hint = "Failed with cookie file. Check that the file exists and is valid.";
        plan.strategies_.push_back(file);
        break;
    }
    case AuthCredential::Type::BROWSER:
    {
        CredentialStrategy browser;
        browser.label = "with cookies from " + credential.value;
        browser.args = {"--cookies-from-browser", credential.value};
        browser.fallback_on_failure = true;
        browser.failure_hint = "Cookie extraction from " + credential.value +
                               " failed. This usually happens when the browser is running and its cookie store is locked. Attempting without cookies...";
        plan.strategies_.push_back(browser);
        plan.strategies_.push_back(anonymous);
        break;
    }
    case AuthCredential::Type::NONE:
    default:
        plan.strategies_.push_back(anonymous);
        break;
    }

    return plan;
}

std::vector<std::string> CredentialPlan::remediationSteps() const
{
    switch (credential_.type)
    {
    case AuthCredential::Type::BROWSER:
        return {
            "Video may be age-restricted and require authentication.",
            "1. Close ALL " + credential_.value + " windows and try again",
            "2. Export cookies manually and pass them with --cookies <file> "
            "(https://github.com/yt-dlp/yt-dlp/wiki/FAQ#how-do-i-pass-cookies-to-yt-dlp)",
            "3. Use a different browser (e.g. --cookies-from-browser firefox)"};
    case AuthCredential::Type::COOKIE_FILE:
        return {"Check that " + credential_.value + " exists, is a Netscape-format cookies.txt and has not expired."};
    case AuthCredential::Type::NONE:
    default:
        return {};
    }
}
