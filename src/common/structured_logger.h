#ifndef MENDER_STRUCTURED_LOGGER_H
#define MENDER_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <thread>
#include <mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mender {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // Renamed to avoid Windows ERROR macro conflict
    CRITICAL
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a configured level name ("debug", "INFO", "warn", ...)
 * @return The parsed level, or @p fallback for unknown names
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Log entry structure with structured data
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;  // Additional structured data

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

/**
 * @brief Log formatter interface
 */
class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable log formatter
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Log sink interface
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File log sink with size-based rotation
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(int index) const;
};

/**
 * @brief Keeps entries in memory so callers can inspect what was logged
 */
class MemoryLogSink : public ILogSink {
public:
    void write(const LogEntry& entry) override;
    void flush() override {}

    std::vector<LogEntry> entries() const;
    bool contains(const std::string& messageFragment) const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<LogEntry> m_entries;
};

/**
 * @brief RAII timer; logs the operation's duration when it goes out of scope
 *
 * Operations slower than the slow threshold are logged at WARNING.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name,
                         std::chrono::milliseconds slow_threshold = std::chrono::milliseconds(1000));
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    std::chrono::milliseconds m_slow_threshold;
    std::chrono::steady_clock::time_point m_start;
    bool m_cancelled;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();

    void log(const LogEntry& entry);
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& context = {});

    // Builds an entry fluently and logs it when destroyed
    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);
        LogBuilder& operation(const std::string& op);
        LogBuilder& duration(std::chrono::nanoseconds ns);

        ~LogBuilder();

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    LogLevel m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;
};

#define SLOG_DEBUG() mender::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() mender::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() mender::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() mender::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() mender::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) mender::ScopedTimer _timer(operation)

} // namespace mender

#endif // MENDER_STRUCTURED_LOGGER_H
