#pragma once

#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

/** Severity attached to every log record. */
enum class LogLevel : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?????";
}

/** Key/value pair carried alongside a log message. */
using LogField = std::pair<std::string, std::string>;
using LogFields = std::vector<LogField>;

/** Build a field from any streamable value. */
template <class T> inline LogField field(std::string key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {std::move(key), oss.str()};
}

/** Build a field from a floating point value using a fixed precision. */
inline LogField field(std::string key, double value, int precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << value;
    return {std::move(key), oss.str()};
}

inline LogField field(std::string key, bool value) {
    return {std::move(key), value ? "true" : "false"};
}

/** Receives every record at or above the logger's minimum level. */
using LogSink = std::function<void(LogLevel, const std::string&, const LogFields&)>;

/** Format a record as a single line: `[vigil] LEVEL message k=v ...`. */
inline std::string format_record(LogLevel level, const std::string& message,
                                 const LogFields& fields) {
    std::ostringstream oss;
    oss << "[vigil] " << level_to_string(level) << ' ' << message;
    for (const auto& f : fields)
        oss << ' ' << f.first << '=' << f.second;
    return oss.str();
}

/**
 * @brief Small structured logger shared by the training services.
 *
 * Each service holds a `std::shared_ptr<Logger>` so a single engine can
 * route all of its output to one sink. The default sink writes to
 * `std::cerr`; tests replace it with a capturing sink.
 */
class Logger {
  public:
    Logger() : sink_{stderr_sink()} {}
    explicit Logger(LogSink sink, LogLevel min_level = LogLevel::Info)
        : sink_{std::move(sink)}, min_level_{min_level} {}

    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(level) >= static_cast<int>(min_level_) && sink_;
    }

    void log(LogLevel level, const std::string& message, const LogFields& fields = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_) || !sink_)
            return;
        sink_(level, message, fields);
    }

    void debug(const std::string& message, const LogFields& fields = {}) const {
        log(LogLevel::Debug, message, fields);
    }
    void info(const std::string& message, const LogFields& fields = {}) const {
        log(LogLevel::Info, message, fields);
    }
    void warn(const std::string& message, const LogFields& fields = {}) const {
        log(LogLevel::Warn, message, fields);
    }
    void error(const std::string& message, const LogFields& fields = {}) const {
        log(LogLevel::Error, message, fields);
    }

    /** Sink writing formatted records to standard error. */
    static LogSink stderr_sink() {
        return [](LogLevel level, const std::string& message, const LogFields& fields) {
            std::cerr << format_record(level, message, fields) << '\n';
        };
    }

    /** Sink discarding all records. */
    static LogSink null_sink() {
        return [](LogLevel, const std::string&, const LogFields&) {};
    }

  private:
    LogSink sink_{};
    LogLevel min_level_{LogLevel::Info};
    mutable std::mutex mutex_{};
};

/** Create a logger writing to standard error. */
inline std::shared_ptr<Logger> make_default_logger() { return std::make_shared<Logger>(); }

/** Create a logger that drops everything. */
inline std::shared_ptr<Logger> make_null_logger() {
    return std::make_shared<Logger>(Logger::null_sink());
}

} // namespace vigil
