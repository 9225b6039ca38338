#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_requested_.load())
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
    }
    shutdown_requested_.store(true);

    if (signal_number != 0)
    {
        Logger::warn("Received signal " + std::to_string(signal_number) + ", stopping after the current job");
    }
    else
    {
        Logger::info("Shutdown requested: " + reason);
    }
}

bool ShutdownManager::isShutdownRequested() noexcept
{
    if (signal_flag_)
    {
        int sig = signal_num_;
        signal_flag_ = 0;
        requestShutdown("Signal received", sig);
    }
    return shutdown_requested_.load();
}

std::function<bool()> ShutdownManager::cancellationCheck()
{
    return [this]()
    { return isShutdownRequested(); };
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
}
