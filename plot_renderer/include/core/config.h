/**
 * @file config.h
 * @brief 配置系统
 *
 * key-value 格式的配置文件：每行 `key value...`，值可以包含空格，
 * `#` 开头的行为注释。环境变量 PLOT_<KEY> 覆盖文件中的同名配置。
 */

#ifndef PLOT_CORE_CONFIG_H
#define PLOT_CORE_CONFIG_H

#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>

#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/utils.h"

namespace plot {

/**
 * @brief 配置管理类
 */
class Config {
private:
    std::map<std::string, std::string> data_;

public:
    Config() = default;

    /**
     * @brief 从文件加载配置
     * @param filename 配置文件路径
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename.c_str());
        if (!fin) {
            return PLOT_ERROR(ErrorCode::FILE_NOT_FOUND, "Cannot open config file " + filename);
        }
        std::string line;
        int lineno = 0;
        while (std::getline(fin, line)) {
            lineno++;
            std::string text = trim(line);
            if (text.empty() || text[0] == '#') {
                continue;
            }
            size_t sep = text.find_first_of(" \t");
            if (sep == std::string::npos) {
                return PLOT_ERROR(ErrorCode::CONFIG_PARSE_ERROR,
                                  filename + ":" + to_string(lineno) + ": missing value for '" + text + "'");
            }
            data_[text.substr(0, sep)] = trim(text.substr(sep + 1));
        }
        return Ok();
    }

    /**
     * @brief 用环境变量覆盖配置
     *
     * 对 keys 中每个键 k，若环境变量 prefix + upper(k) 存在则覆盖。
     */
    void apply_env(const std::vector<std::string> &keys, const std::string &prefix = "PLOT_") {
        for (const auto &key : keys) {
            std::string name = prefix + key;
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            const char *val = getenv(name.c_str());
            if (val) {
                data_[key] = val;
            }
        }
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    /**
     * @brief 添加配置项（如果不存在）
     */
    void add(const std::string &key, const std::string &val) {
        if (data_.count(key) == 0) {
            data_[key] = val;
        }
    }

    bool has(const std::string &key) const {
        return data_.count(key) != 0;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    /**
     * @brief 获取整数配置
     */
    Result<int> get_int(const std::string &key, int default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        char *end = nullptr;
        long v = strtol(it->second.c_str(), &end, 10);
        if (it->second.empty() || *end != '\0') {
            return PLOT_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                              key + " expects an integer, got '" + it->second + "'");
        }
        return static_cast<int>(v);
    }

    /**
     * @brief 获取浮点配置
     */
    Result<double> get_double(const std::string &key, double default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        char *end = nullptr;
        double v = strtod(it->second.c_str(), &end);
        if (it->second.empty() || *end != '\0') {
            return PLOT_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                              key + " expects a number, got '" + it->second + "'");
        }
        return v;
    }

    /**
     * @brief 获取布尔配置（on/off, true/false, yes/no, 1/0）
     */
    Result<bool> get_bool(const std::string &key, bool default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "on" || v == "true" || v == "yes" || v == "1") return true;
        if (v == "off" || v == "false" || v == "no" || v == "0") return false;
        return PLOT_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                          key + " expects on/off, got '" + it->second + "'");
    }

    const std::map<std::string, std::string>& data() const { return data_; }
};

/**
 * @brief 渲染引擎配置的类型化视图
 */
struct RendererConfig {
    std::string artifact_root;    ///< 调试产物根目录
    std::string scratch_root;     ///< 临时目录根，空表示系统临时目录
    std::string python_bin;       ///< 解释器路径，空表示自动查找
    LogLevel log_level;
    std::string log_dir;          ///< 日志文件目录，空表示只输出到控制台
    bool log_color;
    RenderParameters defaults;    ///< 请求缺省字段的默认值（code 为空）

    RendererConfig()
        : artifact_root("./artifacts"), log_level(LogLevel::INFO), log_color(false) {}

    /**
     * @brief 所有可识别的配置键
     */
    static const std::vector<std::string>& keys() {
        static const std::vector<std::string> k = {
            "artifact_root", "scratch_root", "python_bin",
            "log_level", "log_dir", "log_color",
            "default_width", "default_height", "default_dpi", "default_timeout"
        };
        return k;
    }

    static Result<RendererConfig> from_config(const Config &config) {
        RendererConfig rc;
        rc.artifact_root = config.get_str("artifact_root", rc.artifact_root);
        rc.scratch_root = config.get_str("scratch_root");
        rc.python_bin = config.get_str("python_bin");
        rc.log_dir = config.get_str("log_dir");

        std::string level = config.get_str("log_level", "info");
        rc.log_level = parse_log_level(level, LogLevel::OFF);
        if (rc.log_level != parse_log_level(level, LogLevel::TRACE)) {
            return PLOT_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "Unknown log_level '" + level + "'");
        }

        PLOT_TRY_UNWRAP(color, config.get_bool("log_color", false));
        PLOT_TRY_UNWRAP(width, config.get_double("default_width", rc.defaults.width));
        PLOT_TRY_UNWRAP(height, config.get_double("default_height", rc.defaults.height));
        PLOT_TRY_UNWRAP(dpi, config.get_int("default_dpi", rc.defaults.dpi));
        PLOT_TRY_UNWRAP(timeout, config.get_double("default_timeout", rc.defaults.timeout));
        rc.log_color = color;
        rc.defaults.width = width;
        rc.defaults.height = height;
        rc.defaults.dpi = dpi;
        rc.defaults.timeout = timeout;

        // 默认值本身也必须在合法范围内
        RenderParameters probe = rc.defaults;
        probe.code = "pass";
        auto valid = probe.validate();
        if (valid.is_error()) {
            return PLOT_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                              "Invalid default parameter: " + valid.error().message());
        }
        return rc;
    }

    /**
     * @brief 加载配置文件（可选）并应用环境变量覆盖
     * @param filename 配置文件路径，空表示不读文件
     */
    static Result<RendererConfig> load(const std::string &filename) {
        Config config;
        if (!filename.empty()) {
            PLOT_TRY(config.load(filename));
        }
        config.apply_env(keys());
        return from_config(config);
    }
};

} // namespace plot

#endif // PLOT_CORE_CONFIG_H
