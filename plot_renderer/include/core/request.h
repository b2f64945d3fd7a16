/**
 * @file request.h
 * @brief 请求与响应的 JSON 编解码
 *
 * 请求：
 *   {"code": str, "width": num, "height": num, "dpi": int, "timeout": num}
 * 成功响应：
 *   {"base64_png": str|null, "base64_svg": str|null, "logs": str,
 *    "error": str|null, "artifact_id": str}
 * 错误响应：
 *   {"status": 422|504|500, "detail": str, "code": str}
 */

#ifndef PLOT_CORE_REQUEST_H
#define PLOT_CORE_REQUEST_H

#include <string>
#include <memory>
#include <optional>
#include <cmath>

#include <jsoncpp/json/json.h>

#include "core/error.h"
#include "core/types.h"

namespace plot {

namespace detail {

inline Json::Value optional_json(const std::optional<std::string> &v) {
    return v ? Json::Value(*v) : Json::Value(Json::nullValue);
}

inline std::string write_json(const Json::Value &doc) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, doc);
}

} // namespace detail

/**
 * @brief 解析渲染请求
 * @param text JSON 文本
 * @param defaults 缺省字段的取值
 *
 * 只检查结构与类型，数值范围由 RenderParameters::validate() 检查。
 */
inline Result<RenderParameters> parse_render_request(const std::string &text,
                                                     const RenderParameters &defaults) {
    Json::Value doc;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &doc, &errors)) {
        return PLOT_ERROR(ErrorCode::INVALID_REQUEST, "Malformed JSON request: " + errors);
    }
    if (!doc.isObject()) {
        return PLOT_ERROR(ErrorCode::INVALID_REQUEST, "Request must be a JSON object");
    }

    RenderParameters params = defaults;

    const Json::Value &code = doc["code"];
    if (!code.isString()) {
        return PLOT_ERROR(ErrorCode::INVALID_REQUEST, "Field 'code' is required and must be a string");
    }
    params.code = code.asString();

    struct NumberField {
        const char *name;
        double *target;
    };
    for (const NumberField &f : {NumberField{"width", &params.width},
                                 NumberField{"height", &params.height},
                                 NumberField{"timeout", &params.timeout}}) {
        const Json::Value &v = doc[f.name];
        if (v.isNull()) {
            continue;
        }
        if (!v.isNumeric() || v.isBool()) {
            return PLOT_ERROR(ErrorCode::INVALID_REQUEST,
                              std::string("Field '") + f.name + "' must be a number");
        }
        *f.target = v.asDouble();
    }

    const Json::Value &dpi = doc["dpi"];
    if (!dpi.isNull()) {
        bool integral = dpi.isInt() ||
                        (dpi.isDouble() && std::floor(dpi.asDouble()) == dpi.asDouble() &&
                         std::fabs(dpi.asDouble()) < 1e9);
        if (!integral || dpi.isBool()) {
            return PLOT_ERROR(ErrorCode::INVALID_REQUEST, "Field 'dpi' must be an integer");
        }
        params.dpi = dpi.isInt() ? dpi.asInt() : static_cast<int>(dpi.asDouble());
    }
    return params;
}

/**
 * @brief 成功响应
 */
inline std::string render_response_json(const RenderResult &result) {
    Json::Value doc(Json::objectValue);
    doc["base64_png"] = detail::optional_json(result.png_base64);
    doc["base64_svg"] = detail::optional_json(result.svg_base64);
    doc["logs"] = result.logs;
    doc["error"] = detail::optional_json(result.error);
    doc["artifact_id"] = result.artifact_id;
    return detail::write_json(doc);
}

/**
 * @brief 错误响应
 */
inline std::string error_response_json(const Error &error) {
    Json::Value doc(Json::objectValue);
    doc["status"] = error.status();
    doc["detail"] = error.message();
    doc["code"] = error_code_str(error.code());
    return detail::write_json(doc);
}

} // namespace plot

#endif // PLOT_CORE_REQUEST_H
