/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 包含渲染引擎使用的所有基础数据结构：
 * - RenderParameters: 渲染参数
 * - RunStatus / ProcessOutcome: 子进程运行结果
 * - RenderResult: 渲染结果
 */

#ifndef PLOT_CORE_TYPES_H
#define PLOT_CORE_TYPES_H

#include <string>
#include <optional>
#include <ostream>
#include <cstdint>

#include "core/error.h"
#include "core/utils.h"

namespace plot {

//==============================================================================
// 渲染参数
//==============================================================================

// 参数范围
namespace limits {
    const double MIN_SIZE_INCHES = 1.0;
    const double MAX_SIZE_INCHES = 60.0;
    const int MIN_DPI = 50;
    const int MAX_DPI = 600;
    const double MIN_TIMEOUT = 1.0;
    const double MAX_TIMEOUT = 600.0;
}

/**
 * @brief 一次渲染请求的参数
 *
 * validate() 之后视为不可变，按 const 引用传递。
 */
struct RenderParameters {
    std::string code;   ///< 用户脚本源码
    double width;       ///< 图宽（英寸）
    double height;      ///< 图高（英寸）
    int dpi;            ///< 分辨率
    double timeout;     ///< 超时（秒）

    RenderParameters()
        : width(12.0), height(8.0), dpi(150), timeout(120.0) {}

    RenderParameters(const std::string &_code, double _width, double _height,
                     int _dpi, double _timeout)
        : code(_code), width(_width), height(_height), dpi(_dpi), timeout(_timeout) {}

    /**
     * @brief 校验参数
     *
     * 源码去除首尾空白后不能为空；数值必须在范围内。
     */
    Result<void> validate() const {
        if (trim(code).empty()) {
            return PLOT_ERROR(ErrorCode::EMPTY_CODE, "Submitted code is empty.");
        }
        if (!(width >= limits::MIN_SIZE_INCHES && width <= limits::MAX_SIZE_INCHES)) {
            return PLOT_ERROR(ErrorCode::PARAMETER_OUT_OF_RANGE,
                              "width must be between 1 and 60 inches, got " + to_string(width));
        }
        if (!(height >= limits::MIN_SIZE_INCHES && height <= limits::MAX_SIZE_INCHES)) {
            return PLOT_ERROR(ErrorCode::PARAMETER_OUT_OF_RANGE,
                              "height must be between 1 and 60 inches, got " + to_string(height));
        }
        if (dpi < limits::MIN_DPI || dpi > limits::MAX_DPI) {
            return PLOT_ERROR(ErrorCode::PARAMETER_OUT_OF_RANGE,
                              "dpi must be between 50 and 600, got " + to_string(dpi));
        }
        if (!(timeout >= limits::MIN_TIMEOUT && timeout <= limits::MAX_TIMEOUT)) {
            return PLOT_ERROR(ErrorCode::PARAMETER_OUT_OF_RANGE,
                              "timeout must be between 1 and 600 seconds, got " + to_string(timeout));
        }
        return Ok();
    }
};

//==============================================================================
// 子进程运行结果
//==============================================================================

enum class RunStatus {
    OK,
    RUNTIME_ERROR,
    KILLED_BY_SIGNAL,
    TIME_LIMIT,
    INTERNAL_ERROR
};

inline const char* status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case RunStatus::KILLED_BY_SIGNAL: return "KILLED_BY_SIGNAL";
        case RunStatus::TIME_LIMIT: return "TIME_LIMIT";
        case RunStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream &os, RunStatus status) {
    return os << status_to_string(status);
}

/**
 * @brief 一次子进程执行的捕获结果
 */
struct ProcessOutcome {
    std::string stdout_text;   ///< 捕获的标准输出
    std::string stderr_text;   ///< 捕获的标准错误
    int exit_code;             ///< 退出码，被信号终止时为 -1
    int signal;                ///< 终止信号，正常退出时为 0
    RunStatus status;
    bool timed_out;
    uint64_t real_time_ms;

    ProcessOutcome()
        : exit_code(-1), signal(0), status(RunStatus::INTERNAL_ERROR),
          timed_out(false), real_time_ms(0) {}

    bool ok() const { return status == RunStatus::OK && exit_code == 0; }
};

//==============================================================================
// 渲染结果
//==============================================================================

/**
 * @brief 渲染结果分类
 */
enum class Outcome {
    NONE,               ///< 正常出图
    EXECUTION_ERROR,    ///< 用户代码异常，返回错误占位图
    BLANK_PLOT,         ///< 图像几乎是纯色
    OTHER               ///< 无法识别的标记
};

namespace outcome_tag {
    const char* const EXECUTION_ERROR = "EXECUTION_ERROR";
    const char* const BLANK_PLOT = "BLANK_PLOT";
}

inline const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::NONE: return "NONE";
        case Outcome::EXECUTION_ERROR: return "EXECUTION_ERROR";
        case Outcome::BLANK_PLOT: return "BLANK_PLOT";
        default: return "OTHER";
    }
}

inline std::ostream& operator<<(std::ostream &os, Outcome outcome) {
    return os << outcome_to_string(outcome);
}

struct RenderResult {
    std::optional<std::string> png_base64;
    std::optional<std::string> svg_base64;
    std::string logs;
    std::optional<std::string> error;   ///< 结果标记，缺省表示正常
    std::string artifact_id;

    Outcome outcome() const {
        if (!error) return Outcome::NONE;
        if (*error == outcome_tag::EXECUTION_ERROR) return Outcome::EXECUTION_ERROR;
        if (*error == outcome_tag::BLANK_PLOT) return Outcome::BLANK_PLOT;
        return Outcome::OTHER;
    }

    /**
     * @brief 解码 PNG
     * @return PNG 字节，缺失或编码非法时为空
     */
    std::optional<std::string> png_bytes() const {
        if (!png_base64) {
            return std::nullopt;
        }
        std::string bytes;
        if (!base64_decode(*png_base64, bytes)) {
            return std::nullopt;
        }
        return bytes;
    }
};

} // namespace plot

#endif // PLOT_CORE_TYPES_H
