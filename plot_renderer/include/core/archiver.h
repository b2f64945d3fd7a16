/**
 * @file archiver.h
 * @brief 调试产物归档
 *
 * 目录结构：
 *   <root>/<id>/program.py   生成的 worker 程序
 *   <root>/<id>/logs.txt     最终日志
 *   <root>/<id>/plot.png     位图（仅当存在时）
 *
 * 只写不读，不做清理。每个标识符只能写一次，文件以独占方式创建。
 */

#ifndef PLOT_CORE_ARCHIVER_H
#define PLOT_CORE_ARCHIVER_H

#include <string>
#include <optional>
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

#include "core/error.h"
#include "core/utils.h"
#include "core/render_logger.h"

namespace plot {

class ArtifactArchiver {
private:
    std::string root_;

public:
    explicit ArtifactArchiver(const std::string &root) : root_(root) {}

    const std::string& root() const { return root_; }

    std::string artifact_dir(const std::string &id) const {
        return root_ + "/" + id;
    }

    /**
     * @brief 创建归档根目录（启动时调用一次）
     */
    Result<void> init() const {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec || !dir_exists(root_)) {
            return PLOT_ERROR(ErrorCode::DIRECTORY_CREATE_ERROR,
                              "Cannot create artifact root " + root_ + ": " + ec.message());
        }
        ALOG_DEBUG << "Artifact root ready: " << root_;
        return Ok();
    }

    /**
     * @brief 写入一组产物
     * @param id 新的唯一标识符，目录已存在时失败
     * @param program_text worker 程序
     * @param logs 最终日志
     * @param png_base64 Base64 编码的 PNG，缺失时不写 plot.png
     */
    Result<void> persist(const std::string &id,
                         const std::string &program_text,
                         const std::string &logs,
                         const std::optional<std::string> &png_base64) const {
        PLOT_ENSURE(!id.empty() && id.find('/') == std::string::npos && id != "." && id != "..",
                    ErrorCode::INVALID_REQUEST, "Invalid artifact id '" + id + "'");

        std::string dir = artifact_dir(id);
        if (mkdir(dir.c_str(), 0755) < 0) {
            return PLOT_ERROR(ErrorCode::DIRECTORY_CREATE_ERROR,
                              "Cannot create " + dir + ": " + strerror(errno));
        }

        if (!write_file_exclusive(dir + "/program.py", program_text)) {
            return PLOT_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + dir + "/program.py");
        }
        if (!write_file_exclusive(dir + "/logs.txt", logs)) {
            return PLOT_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + dir + "/logs.txt");
        }
        if (png_base64) {
            std::string png;
            if (!base64_decode(*png_base64, png)) {
                return PLOT_ERROR(ErrorCode::FILE_WRITE_ERROR,
                                  "PNG payload of " + id + " is not valid base64");
            }
            if (!write_file_exclusive(dir + "/plot.png", png)) {
                return PLOT_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + dir + "/plot.png");
            }
        }

        ALOG_INFO << "Archived " << id << (png_base64 ? " (with png)" : "");
        return Ok();
    }
};

} // namespace plot

#endif // PLOT_CORE_ARCHIVER_H
