/**
 * @file error.h
 * @brief 统一错误处理机制
 *
 * 提供：
 * - Result<T> 类型：类似 Rust 的结果类型
 * - Error 类与错误码
 * - 错误码到 HTTP 风格状态码的映射（供请求层使用）
 * - 错误传播宏
 *
 * 渲染过程中的用户级错误（脚本异常、空白图）在 worker 内部处理，
 * 不会出现在这里；这里只表示宿主侧的致命错误。
 */

#ifndef PLOT_CORE_ERROR_H
#define PLOT_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <sstream>
#include <ostream>
#include <type_traits>
#include <utility>

namespace plot {

//==============================================================================
// 错误码定义
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 文件操作错误 (1xx)
    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,
    DIRECTORY_CREATE_ERROR = 103,

    // 配置错误 (2xx)
    CONFIG_PARSE_ERROR = 200,
    CONFIG_INVALID_VALUE = 202,

    // 请求错误 (3xx)
    INVALID_REQUEST = 300,
    EMPTY_CODE = 301,
    PARAMETER_OUT_OF_RANGE = 302,

    // 渲染错误 (4xx)
    RUNTIME_NOT_FOUND = 400,
    RENDER_TIMEOUT = 401,
    EMPTY_OUTPUT = 402,
    MALFORMED_PAYLOAD = 403,

    // 系统错误 (9xx)
    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903,
    UNKNOWN_ERROR = 999
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::DIRECTORY_CREATE_ERROR: return "DIRECTORY_CREATE_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::EMPTY_CODE: return "EMPTY_CODE";
        case ErrorCode::PARAMETER_OUT_OF_RANGE: return "PARAMETER_OUT_OF_RANGE";
        case ErrorCode::RUNTIME_NOT_FOUND: return "RUNTIME_NOT_FOUND";
        case ErrorCode::RENDER_TIMEOUT: return "RENDER_TIMEOUT";
        case ErrorCode::EMPTY_OUTPUT: return "EMPTY_OUTPUT";
        case ErrorCode::MALFORMED_PAYLOAD: return "MALFORMED_PAYLOAD";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::EXEC_FAILED: return "EXEC_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief 错误码对应的 HTTP 风格状态码
 *
 * 请求不合法 -> 422，渲染超时 -> 504，其余 -> 500
 */
inline int error_code_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return 200;
        case ErrorCode::INVALID_REQUEST:
        case ErrorCode::EMPTY_CODE:
        case ErrorCode::PARAMETER_OUT_OF_RANGE:
            return 422;
        case ErrorCode::RENDER_TIMEOUT:
            return 504;
        default:
            return 500;
    }
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// Error 类
//==============================================================================

/**
 * @brief 错误信息类
 */
class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}

    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}

    Error(ErrorCode code, const std::string &message,
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    int status() const { return error_code_status(code_); }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }  // true 表示有错误

    /**
     * @brief 格式化错误信息（用于日志）
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!file_.empty() && line_ > 0) {
            oss << " at " << file_ << ":" << line_;
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T> 类型
//==============================================================================

/**
 * @brief 结果类型，类似 Rust 的 Result<T, E>
 *
 * 用法：
 *   Result<RenderResult> r = renderer.render(params);
 *   if (r.ok()) {
 *       use(r.value());
 *   } else {
 *       report(r.error());
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}

    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : data_(Error(code, msg)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(const T &default_val) const {
        return ok() ? std::get<T>(data_) : default_val;
    }

    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }
};

/**
 * @brief 无值的结果类型（仅表示成功/失败）
 */
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

/**
 * @brief 创建成功结果
 */
template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

//==============================================================================
// 错误处理宏
//==============================================================================

/**
 * @brief 创建带位置信息的错误
 */
#define PLOT_ERROR(code, msg) \
    plot::Error(code, msg, __FILE__, __LINE__)

/**
 * @brief 如果结果是错误，则返回错误（类似 Rust 的 ? 操作符）
 */
#define PLOT_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error(); \
        } \
    } while (0)

/**
 * @brief 如果结果是错误，则返回错误；否则解包值
 */
#define PLOT_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (_tmp_##var.is_error()) { \
        return _tmp_##var.error(); \
    } \
    auto var = std::move(_tmp_##var.value())

/**
 * @brief 断言条件，失败时返回错误
 */
#define PLOT_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return PLOT_ERROR(code, msg); \
        } \
    } while (0)

} // namespace plot

#endif // PLOT_CORE_ERROR_H
