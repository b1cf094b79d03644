#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/pattern_formatter.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace PaletteLogging {

    // Sink that pushes every formatted payload to the recent-message queue
    class QueueSink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit QueueSink(LogQueue& queue) : logQueue(queue) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            // Convert spdlog level to our LogLevel enum
            LogLevel level;
            switch (msg.level) {
                case spdlog::level::trace:    level = LogLevel::Trace; break;
                case spdlog::level::debug:    level = LogLevel::Debug; break;
                case spdlog::level::info:     level = LogLevel::Info; break;
                case spdlog::level::warn:     level = LogLevel::Warn; break;
                case spdlog::level::err:      level = LogLevel::Error; break;
                case spdlog::level::critical: level = LogLevel::Critical; break;
                default:                      level = LogLevel::Info; break;
            }

            std::string message = fmt::to_string(msg.payload);
            if (message.empty()) {
                return;
            }

            logQueue.Push(LogMessage(message, level));
        }

        void flush_() override {
            // Nothing to flush for the queue sink
        }

    private:
        LogQueue& logQueue;
    };

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;

    static LogQueue logQueue;
    static bool initialized = false;

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // LogQueue implementation
    void LogQueue::Push(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);

        // Remove old messages if queue is full
        while (queue.size() >= MAX_QUEUE_SIZE) {
            queue.pop();
        }

        queue.push(message);
    }

    bool LogQueue::TryPop(LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }

        message = queue.front();
        queue.pop();
        return true;
    }

    void LogQueue::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        std::queue<LogMessage> empty;
        queue.swap(empty);
    }

    size_t LogQueue::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    // Logging system functions
    bool Initialize(const LoggingConfig& config) {
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            if (config.logToConsole) {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(spdlog::level::trace);
                console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(console_sink);
            }

            if (config.logToFile) {
                std::filesystem::path logPath(config.filePath);
                if (logPath.has_parent_path()) {
                    std::filesystem::create_directories(logPath.parent_path());
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            // Queue sink (always attached)
            auto queue_sink = std::make_shared<QueueSink>(logQueue);
            queue_sink->set_level(spdlog::level::trace);
            queue_sink->set_pattern("%v");
            sinks.push_back(queue_sink);

            logger = std::make_shared<spdlog::logger>("palettes", sinks.begin(), sinks.end());
            logger->set_level(ToSpdlogLevel(config.level));
            logger->flush_on(spdlog::level::warn);

            initialized = true;

            Log(LogLevel::Debug, "Palette logging system initialized");

            return true;
        }
        catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Failed to initialize palette logging: " << ex.what() << std::endl;
            return false;
        }
        catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
            return false;
        }
    }

    void Shutdown() {
        if (!initialized) {
            return;
        }

        Log(LogLevel::Debug, "Shutting down palette logging system");

        if (logger) {
            logger->flush();
            logger.reset();
        }

        logQueue.Clear();
        initialized = false;
    }

    bool IsInitialized() {
        return initialized;
    }

    LogQueue& GetLogQueue() {
        return logQueue;
    }

    LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace")    return LogLevel::Trace;
        if (lower == "debug")    return LogLevel::Debug;
        if (lower == "info")     return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error")    return LogLevel::Error;
        if (lower == "critical") return LogLevel::Critical;
        return fallback;
    }

    const char* LogLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return "trace";
            case LogLevel::Debug:    return "debug";
            case LogLevel::Info:     return "info";
            case LogLevel::Warn:     return "warn";
            case LogLevel::Error:    return "error";
            case LogLevel::Critical: return "critical";
        }
        return "info";
    }

    void Log(LogLevel level, const std::string& message) {
        if (!initialized || !logger || message.empty()) {
            // Logger not initialized or already destroyed - fail silently
            return;
        }

        switch (level) {
            case LogLevel::Trace:    logger->trace(message); break;
            case LogLevel::Debug:    logger->debug(message); break;
            case LogLevel::Info:     logger->info(message); break;
            case LogLevel::Warn:     logger->warn(message); break;
            case LogLevel::Error:    logger->error(message); break;
            case LogLevel::Critical: logger->critical(message); break;
        }
    }

}
