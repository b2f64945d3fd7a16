/**
 * @file extractor.h
 * @brief 从子进程输出中提取渲染结果
 *
 * stdout 可以包含任意文本，只有去除首尾空白后的最后一行是结果：
 *   {"png": str|null, "svg": str|null, "logs": str|null, "error": str|null}
 * stderr 非空时追加到日志末尾。
 */

#ifndef PLOT_CORE_EXTRACTOR_H
#define PLOT_CORE_EXTRACTOR_H

#include <string>
#include <memory>
#include <optional>
#include <functional>

#include <jsoncpp/json/json.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"

namespace plot {

/**
 * @brief 产物标识符生成器
 */
using IdGenerator = std::function<std::string()>;

class ResultExtractor {
private:
    IdGenerator id_generator_;

    /**
     * @brief 读取可选字符串字段（缺失或 null 为空）
     * @return false 表示字段类型错误
     */
    static bool optional_string(const Json::Value &obj, const char *key,
                                std::optional<std::string> &out) {
        const Json::Value &v = obj[key];
        if (v.isNull()) {
            out.reset();
            return true;
        }
        if (!v.isString()) {
            return false;
        }
        out = v.asString();
        return true;
    }

public:
    ResultExtractor() : id_generator_(random_hex_id) {}
    explicit ResultExtractor(IdGenerator generator) : id_generator_(std::move(generator)) {}

    /**
     * @brief 解析进程输出
     */
    Result<RenderResult> extract(const ProcessOutcome &outcome) const {
        if (outcome.timed_out) {
            return PLOT_ERROR(ErrorCode::RENDER_TIMEOUT, "Renderer timed out.");
        }

        std::string out = trim(outcome.stdout_text);
        std::string err = trim(outcome.stderr_text);
        if (out.empty()) {
            return PLOT_ERROR(ErrorCode::EMPTY_OUTPUT, "Renderer produced no output. stderr=" + err);
        }

        std::string line = trim(last_line(out));
        Json::Value payload;
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string parse_errors;
        bool parsed = reader->parse(line.data(), line.data() + line.size(), &payload, &parse_errors);
        if (!parsed || !payload.isObject()) {
            return PLOT_ERROR(ErrorCode::MALFORMED_PAYLOAD, "Invalid renderer payload: " + line);
        }

        RenderResult result;
        std::optional<std::string> logs;
        if (!optional_string(payload, "png", result.png_base64) ||
            !optional_string(payload, "svg", result.svg_base64) ||
            !optional_string(payload, "error", result.error) ||
            !optional_string(payload, "logs", logs)) {
            return PLOT_ERROR(ErrorCode::MALFORMED_PAYLOAD, "Invalid renderer payload: " + line);
        }

        result.logs = logs.value_or("");
        if (!err.empty()) {
            if (!result.logs.empty()) {
                result.logs += "\n";
            }
            result.logs += err;
        }
        result.artifact_id = id_generator_();
        return result;
    }
};

} // namespace plot

#endif // PLOT_CORE_EXTRACTOR_H
