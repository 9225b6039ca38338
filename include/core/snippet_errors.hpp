#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error raised by the extraction pipeline
 *
 * Per-job kinds (validation, resolution, fetch, trim, convert) are caught by
 * the BatchOrchestrator and attributed to a row. ConfigurationError and
 * InterruptError are the only kinds that reach main().
 */
class SnippetError : public std::runtime_error
{
public:
    explicit SnippetError(const std::string &message)
        : std::runtime_error(message) {}

    virtual const char *kind() const noexcept { return "SnippetError"; }
};

// Malformed or incomplete job row
class ValidationError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "ValidationError"; }
};

class ResolutionError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "ResolutionError"; }
};

class FetchError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "FetchError"; }
};

class TrimError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "TrimError"; }
};

class ConvertError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "ConvertError"; }
};

/**
 * @brief Fatal setup problem: missing tool, unreadable job table, bad config
 */
class ConfigurationError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "ConfigurationError"; }
};

/**
 * @brief Operator cancellation observed between jobs
 */
class InterruptError : public SnippetError
{
public:
    using SnippetError::SnippetError;
    const char *kind() const noexcept override { return "InterruptError"; }
};
