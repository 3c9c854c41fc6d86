// =============================================================================
// bamseek - Logger Module Implementation
// =============================================================================

#include "bamseek/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace bamseek::log {

namespace {

// Installed by init(), cleared by shutdown(). Read lock-free by every macro.
std::atomic<quill::Logger*> gLogger{nullptr};

// Serializes init() and shutdown().
std::mutex gLifecycleMutex;

struct LevelName {
    std::string_view name;
    Level level;
};

constexpr std::array<LevelName, 8> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

constexpr char asciiLower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

quill::LogLevel quillThreshold(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
            config.loggerName + "_console"));
    }
    return sinks;
}

}  // namespace

Level levelFromString(std::string_view name) noexcept {
    const auto it = std::ranges::find_if(kLevelNames, [name](const LevelName& entry) {
        return std::ranges::equal(name, entry.name, [](char lhs, char rhs) {
            return asciiLower(lhs) == rhs;
        });
    });
    return it == kLevelNames.end() ? Level::kInfo : it->level;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* installed =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    installed->set_log_level(quillThreshold(config.level));

    gLogger.store(installed, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* installed = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (installed == nullptr) {
        return;
    }

    installed->flush_log();
    quill::Backend::stop();
}

}  // namespace bamseek::log
