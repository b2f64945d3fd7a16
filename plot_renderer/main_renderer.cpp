/**
 * @file main_renderer.cpp
 * @brief 命令行入口
 *
 * 用法：plot_renderer [-c <config>] [<request.json> | -]
 *
 * 从文件或 stdin 读取一个 JSON 请求，在 stdout 输出一个 JSON 文档。
 * 日志只写到 stderr 和日志文件。
 *
 * 退出码：
 *   0  得到渲染结果（无论结果分类如何）
 *   1  渲染失败（超时、输出无法解析等）
 *   2  用法或配置错误（包括找不到解释器）
 */

#include <iostream>
#include <sstream>
#include <string>
#include <cstring>

#include "plot_renderer.h"

using namespace plot;

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [-c <config>] [<request.json> | -]" << std::endl;
}

static bool read_request(const std::string &path, std::string &text) {
    if (path.empty() || path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        text = ss.str();
        return true;
    }
    return read_file(path, text);
}

int main(int argc, char **argv) {
    std::string config_path;
    std::string request_path;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            config_path = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (request_path.empty()) {
            request_path = argv[i];
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    // 配置
    auto config = RendererConfig::load(config_path);
    if (config.is_error()) {
        LOG_FATAL << "Configuration error: " << config.error().to_string();
        std::cout << error_response_json(config.error()) << std::endl;
        return 2;
    }
    init_logging(config.value());

    auto renderer = Renderer::create(config.value());
    if (renderer.is_error()) {
        MLOG_FATAL << renderer.error().to_string();
        std::cout << error_response_json(renderer.error()) << std::endl;
        render_log().flush_all();
        return 2;
    }

    // 请求
    std::string text;
    if (!read_request(request_path, text)) {
        Error err = PLOT_ERROR(ErrorCode::FILE_READ_ERROR, "Cannot read request " + request_path);
        MLOG_ERROR << err.to_string();
        std::cout << error_response_json(err) << std::endl;
        render_log().flush_all();
        return 2;
    }

    auto params = parse_render_request(text, config.value().defaults);
    if (params.is_error()) {
        MLOG_WARN << "Invalid request: " << params.error().to_string();
        std::cout << error_response_json(params.error()) << std::endl;
        render_log().flush_all();
        return 1;
    }

    // 渲染
    auto result = renderer.value().render(params.value());
    if (result.is_error()) {
        std::cout << error_response_json(result.error()) << std::endl;
        render_log().flush_all();
        return 1;
    }

    std::cout << render_response_json(result.value()) << std::endl;
    render_log().flush_all();
    return 0;
}
