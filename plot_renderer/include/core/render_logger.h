/**
 * @file render_logger.h
 * @brief 渲染引擎专用日志配置
 *
 * 为渲染引擎提供预配置的日志功能：
 * - 主日志（请求流水线）
 * - 进程日志（启动、等待、强制终止）
 * - 归档日志（调试产物写入）
 */

#ifndef PLOT_CORE_RENDER_LOGGER_H
#define PLOT_CORE_RENDER_LOGGER_H

#include "core/logger.h"
#include <string>

namespace plot {

/**
 * @brief 渲染日志管理器
 */
class RenderLogger {
private:
    Logger main_logger_;      ///< 主日志
    Logger process_logger_;   ///< 进程日志
    Logger archive_logger_;   ///< 归档日志
    bool initialized_;

    void attach(Logger &logger, LogLevel level, bool color, const std::string &log_dir) {
        logger.clear_sinks();
        logger.set_level(level)
              .show_timestamp(true)
              .show_name(true)
              .show_location(level <= LogLevel::DEBUG);
        logger.add_console(color);
        if (!log_dir.empty()) {
            std::string path = log_dir + "/" + logger.name() + ".log";
            if (!logger.add_file(path)) {
                LOGGER_WARN(logger) << "Cannot open log file " << path;
            }
        }
    }

public:
    RenderLogger()
        : main_logger_("main"),
          process_logger_("process"),
          archive_logger_("archive"),
          initialized_(false) {
        // 未初始化时也输出到控制台
        main_logger_.add_console(false);
        process_logger_.add_console(false);
        archive_logger_.add_console(false);
    }

    /**
     * @brief 初始化日志系统
     * @param level 日志级别
     * @param color 控制台是否彩色
     * @param log_dir 日志文件目录，空表示只输出到控制台
     */
    void init(LogLevel level = LogLevel::INFO, bool color = false,
              const std::string &log_dir = "") {
        attach(main_logger_, level, color, log_dir);
        attach(process_logger_, level, color, log_dir);
        attach(archive_logger_, level, color, log_dir);
        initialized_ = true;
    }

    bool initialized() const { return initialized_; }

    Logger& main()    { return main_logger_; }
    Logger& process() { return process_logger_; }
    Logger& archive() { return archive_logger_; }

    void flush_all() {
        main_logger_.flush();
        process_logger_.flush();
        archive_logger_.flush();
    }

    void set_all_levels(LogLevel level) {
        main_logger_.set_level(level);
        process_logger_.set_level(level);
        archive_logger_.set_level(level);
    }
};

/**
 * @brief 获取全局渲染日志器
 */
inline RenderLogger& render_log() {
    static RenderLogger instance;
    return instance;
}

} // namespace plot

//==============================================================================
// 渲染引擎专用日志宏
//==============================================================================

// 主日志
#define MLOG_TRACE LOGGER_TRACE(plot::render_log().main())
#define MLOG_DEBUG LOGGER_DEBUG(plot::render_log().main())
#define MLOG_INFO  LOGGER_INFO(plot::render_log().main())
#define MLOG_WARN  LOGGER_WARN(plot::render_log().main())
#define MLOG_ERROR LOGGER_ERROR(plot::render_log().main())
#define MLOG_FATAL LOGGER_FATAL(plot::render_log().main())

// 进程日志
#define PLOG_TRACE LOGGER_TRACE(plot::render_log().process())
#define PLOG_DEBUG LOGGER_DEBUG(plot::render_log().process())
#define PLOG_INFO  LOGGER_INFO(plot::render_log().process())
#define PLOG_WARN  LOGGER_WARN(plot::render_log().process())
#define PLOG_ERROR LOGGER_ERROR(plot::render_log().process())

// 归档日志
#define ALOG_TRACE LOGGER_TRACE(plot::render_log().archive())
#define ALOG_DEBUG LOGGER_DEBUG(plot::render_log().archive())
#define ALOG_INFO  LOGGER_INFO(plot::render_log().archive())
#define ALOG_WARN  LOGGER_WARN(plot::render_log().archive())
#define ALOG_ERROR LOGGER_ERROR(plot::render_log().archive())

#endif // PLOT_CORE_RENDER_LOGGER_H
