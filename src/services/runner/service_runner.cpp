/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "tds/service/service_runner.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace tds::service {

namespace {

using kcenon::common::VoidResult;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

std::string_view levelTag(log_level level) {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARN";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRIT";
        case log_level::off:      return "OFF";
    }
    return "?";
}

log_level toKcenon(tds::foundation::LogLevel level) {
    using tds::foundation::LogLevel;
    switch (level) {
        case LogLevel::Trace:    return log_level::trace;
        case LogLevel::Debug:    return log_level::debug;
        case LogLevel::Info:     return log_level::info;
        case LogLevel::Warning:  return log_level::warning;
        case LogLevel::Error:    return log_level::error;
        case LogLevel::Critical: return log_level::critical;
        case LogLevel::Off:      return log_level::off;
    }
    return log_level::info;
}

/// Writes one line per entry to std::clog.
class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(log_level minLevel) : minLevel_(minLevel) {}

    VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return VoidResult::ok(std::monostate{});
        }
        std::lock_guard lock(mutex_);
        std::clog << levelTag(level) << ' ' << message << '\n';
        return VoidResult::ok(std::monostate{});
    }

    VoidResult log(log_level level, std::string_view message,
                   const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::clog.flush();
        return VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    std::atomic<log_level> minLevel_;
};

} // namespace

// -- Console logging ---------------------------------------------------------

void installConsoleLogger(tds::foundation::LogLevel minLevel) {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<ConsoleLogger>(toKcenon(minLevel)));
}

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

tds::foundation::GameResult<void>
loadConfig(tds::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("TDS_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace tds::service
