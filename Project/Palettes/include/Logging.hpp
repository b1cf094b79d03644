#pragma once

#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <chrono>
#include <sstream>
#include <utility>

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef PALETTES_EXPORTS
#define PALETTES_API __declspec(dllexport)
#else
#define PALETTES_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef PALETTES_EXPORTS
#define PALETTES_API __attribute__((visibility("default")))
#else
#define PALETTES_API
#endif
#endif

namespace PaletteLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Structure for queued log messages, read back by host UIs and tests
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Bounded queue of the most recent log messages
    class LogQueue {
    public:
        void Push(const LogMessage& message);
        bool PALETTES_API TryPop(LogMessage& message);
        void PALETTES_API Clear();
        size_t PALETTES_API Size() const;

    private:
        mutable std::mutex mutex;
        std::queue<LogMessage> queue;
        static constexpr size_t MAX_QUEUE_SIZE = 1000;
    };

    struct LoggingConfig {
        LogLevel level = LogLevel::Info;
        bool logToConsole = true;
        bool logToFile = false;
        std::string filePath = "logs/palettes.log";
    };

    // Initialize the logging system. Calling it again while initialized is a no-op.
    PALETTES_API bool Initialize(const LoggingConfig& config = LoggingConfig{});

    // Shutdown the logging system
    PALETTES_API void Shutdown();

    PALETTES_API bool IsInitialized();

    // Get the in-memory queue of recent messages
    PALETTES_API LogQueue& GetLogQueue();

    // Maps "trace", "debug", "info", "warn", "error", "critical" (case-insensitive).
    // Unknown names return the fallback.
    PALETTES_API LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::Info);

    // Lower-case name accepted by ParseLogLevel
    PALETTES_API const char* LogLevelName(LogLevel level);

    // Logging function
    void PALETTES_API Log(LogLevel level, const std::string& message);

    // Concatenates every piece with operator<< and logs the result at the given level.
    template <typename... Args>
    void PrintOutput(LogLevel level, Args&&... pieces)
    {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(pieces));
        Log(level, oss.str());
    }

}

/**
 * @brief Logs a message built from several pieces.
 *
 * PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[AuthorityManager] Stopped at index ", index);
 */
#define PALETTES_PRINT(...) PaletteLogging::PrintOutput(__VA_ARGS__)
