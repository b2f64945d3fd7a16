/**
 * @file runtime.h
 * @brief 解释器定位
 *
 * 查找顺序：
 * 1. 配置中的 python_bin（必须可执行）
 * 2. 当前虚拟环境 $VIRTUAL_ENV/bin/python3, $VIRTUAL_ENV/bin/python
 * 3. PATH 中的 python3, python
 */

#ifndef PLOT_SANDBOX_RUNTIME_H
#define PLOT_SANDBOX_RUNTIME_H

#include <string>
#include <vector>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "core/error.h"
#include "core/utils.h"

namespace plot {
namespace sandbox {

// 转为绝对路径，不解析符号链接
inline std::string absolute_path(const std::string &path) {
    std::error_code ec;
    std::string abs = std::filesystem::absolute(path, ec).lexically_normal().string();
    return ec ? "" : abs;
}

/**
 * @brief 在 PATH 中查找可执行文件
 * @return 找到的绝对路径，找不到返回空字符串
 */
inline std::string search_path(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? absolute_path(name) : "";
    }
    const char *path_env = getenv("PATH");
    if (!path_env) {
        return "";
    }
    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) {
            return absolute_path(candidate);
        }
    }
    return "";
}

/**
 * @brief 解析用于执行 worker 的解释器
 * @param configured 配置的解释器路径或名称，空表示自动查找
 */
inline Result<std::string> resolve_runtime(const std::string &configured = "") {
    if (!configured.empty()) {
        std::string found = search_path(configured);
        if (found.empty()) {
            return PLOT_ERROR(ErrorCode::RUNTIME_NOT_FOUND,
                              "Configured interpreter is not executable: " + configured);
        }
        return found;
    }

    const char *venv = getenv("VIRTUAL_ENV");
    if (venv && *venv) {
        for (const char *name : {"python3", "python"}) {
            std::string candidate = std::string(venv) + "/bin/" + name;
            if (is_executable(candidate)) {
                return absolute_path(candidate);
            }
        }
    }

    for (const char *name : {"python3", "python"}) {
        std::string found = search_path(name);
        if (!found.empty()) {
            return found;
        }
    }
    return PLOT_ERROR(ErrorCode::RUNTIME_NOT_FOUND, "Python interpreter not available.");
}

} // namespace sandbox
} // namespace plot

#endif // PLOT_SANDBOX_RUNTIME_H
