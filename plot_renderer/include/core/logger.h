/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
 * - 控制台输出统一写到 stderr（stdout 留给响应文档）
 * - 文件输出（追加模式）
 * - 格式化前缀（时间戳、级别、日志器名称、位置）
 * - 线程安全
 */

#ifndef PLOT_CORE_LOGGER_H
#define PLOT_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <algorithm>
#include <cctype>

namespace plot {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

/**
 * @brief 解析配置中的日志级别（大小写不敏感）
 * @param name 级别名称，如 "debug"、"warn"
 * @param def 无法识别时返回的默认值
 */
inline LogLevel parse_log_level(std::string name, LogLevel def = LogLevel::INFO) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return def;
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default: return "";
    }
}

/**
 * @brief 日志输出接口
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出
 *
 * 所有级别都写到 stderr：CLI 的 stdout 只能包含一个 JSON 文档。
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = false) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (use_color_) {
            std::cerr << level_to_color(level) << message << "\033[0m" << std::endl;
        } else {
            std::cerr << message << std::endl;
        }
    }

    void flush() override {
        std::cerr.flush();
    }
};

/**
 * @brief 文件输出
 */
class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;
    bool auto_flush_;

public:
    explicit FileSink(const std::string &filename, bool auto_flush = true)
        : auto_flush_(auto_flush) {
        file_.open(filename, std::ios::app);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) return;
        file_ << message << '\n';
        if (auto_flush_) {
            file_.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }
};

/**
 * @brief 日志记录器
 */
class Logger {
private:
    std::string name_;
    LogLevel level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
    bool show_timestamp_;
    bool show_name_;
    bool show_location_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static std::string basename(const std::string &path) {
        size_t pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }

public:
    explicit Logger(const std::string &name = "plot")
        : name_(name), level_(LogLevel::INFO),
          show_timestamp_(true), show_name_(true), show_location_(false) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_timestamp(bool show) { show_timestamp_ = show; return *this; }
    Logger& show_name(bool show) { show_name_ = show; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    LogLevel level() const { return level_; }
    const std::string& name() const { return name_; }
    size_t sink_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }
    bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::OFF; }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = false) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出
     * @return 文件是否成功打开
     */
    bool add_file(const std::string &filename) {
        auto sink = std::make_shared<FileSink>(filename);
        if (!sink->is_open()) {
            return false;
        }
        add_sink(sink);
        return true;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) return;

        std::ostringstream oss;
        if (show_timestamp_) {
            oss << "[" << get_timestamp() << "] ";
        }
        oss << "[" << level_to_string(level) << "] ";
        if (show_name_) {
            oss << "[" << name_ << "] ";
        }
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;

        std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }
};

/**
 * @brief 全局默认日志器（未初始化 RenderLogger 前使用）
 */
inline Logger& default_logger() {
    static Logger logger("plot");
    static std::once_flag console_once;
    std::call_once(console_once, [] { logger.add_console(false); });
    return logger;
}

/**
 * @brief 流式日志构建器，析构时输出
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (logger_.enabled(level_)) {
            stream_ << value;
        }
        return *this;
    }
};

} // namespace plot

//==============================================================================
// 日志宏
//==============================================================================

#define LOG_SET_LEVEL(level) plot::default_logger().set_level(level)

#define LOG_TRACE plot::LogStream(plot::default_logger(), plot::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG plot::LogStream(plot::default_logger(), plot::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO  plot::LogStream(plot::default_logger(), plot::LogLevel::INFO,  __FILE__, __LINE__)
#define LOG_WARN  plot::LogStream(plot::default_logger(), plot::LogLevel::WARN,  __FILE__, __LINE__)
#define LOG_ERROR plot::LogStream(plot::default_logger(), plot::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_FATAL plot::LogStream(plot::default_logger(), plot::LogLevel::FATAL, __FILE__, __LINE__)

#define LOGGER_TRACE(logger) plot::LogStream(logger, plot::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) plot::LogStream(logger, plot::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  plot::LogStream(logger, plot::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  plot::LogStream(logger, plot::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) plot::LogStream(logger, plot::LogLevel::ERROR, __FILE__, __LINE__)
#define LOGGER_FATAL(logger) plot::LogStream(logger, plot::LogLevel::FATAL, __FILE__, __LINE__)

#endif // PLOT_CORE_LOGGER_H
