/**
 * @file scratch_dir.h
 * @brief 临时工作目录（RAII）
 *
 * 每次渲染独占一个目录：
 *   <root>/plot-worker-XXXXXX/
 *     program.py
 *     mpl/          MPLCONFIGDIR 与 XDG_CACHE_HOME
 * 析构时整个目录被删除。
 */

#ifndef PLOT_SANDBOX_SCRATCH_DIR_H
#define PLOT_SANDBOX_SCRATCH_DIR_H

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <cstdlib>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

#include "core/error.h"
#include "core/render_logger.h"

namespace plot {
namespace sandbox {

namespace fs = std::filesystem;

class ScratchDir {
private:
    std::string path_;

    explicit ScratchDir(const std::string &path) : path_(path) {}

public:
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir &&other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScratchDir& operator=(ScratchDir &&other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    ~ScratchDir() {
        remove();
    }

    /**
     * @brief 在 root 下创建一个私有目录
     * @param root 根目录，空表示系统临时目录
     */
    static Result<ScratchDir> create(const std::string &root = "",
                                     const std::string &prefix = "plot-worker-") {
        std::string base = root;
        if (base.empty()) {
            std::error_code ec;
            base = fs::temp_directory_path(ec).string();
            if (ec || base.empty()) {
                base = "/tmp";
            }
        }
        // 子进程会 chdir 到该目录，路径必须是绝对路径
        std::error_code abs_ec;
        base = fs::absolute(base, abs_ec).lexically_normal().string();
        if (abs_ec) {
            return PLOT_ERROR(ErrorCode::DIRECTORY_CREATE_ERROR,
                              "Cannot resolve scratch root " + root + ": " + abs_ec.message());
        }

        std::vector<char> tmpl(base.begin(), base.end());
        std::string suffix = "/" + prefix + "XXXXXX";
        tmpl.insert(tmpl.end(), suffix.begin(), suffix.end());
        tmpl.push_back('\0');
        if (mkdtemp(tmpl.data()) == nullptr) {
            return PLOT_ERROR(ErrorCode::DIRECTORY_CREATE_ERROR,
                              "Cannot create scratch directory under " + base + ": " + strerror(errno));
        }

        ScratchDir dir(tmpl.data());
        if (mkdir(dir.mpl_dir().c_str(), 0700) < 0) {
            return PLOT_ERROR(ErrorCode::DIRECTORY_CREATE_ERROR,
                              "Cannot create " + dir.mpl_dir() + ": " + strerror(errno));
        }
        PLOG_DEBUG << "Created scratch directory " << dir.path();
        return dir;
    }

    const std::string& path() const { return path_; }
    std::string program_path() const { return path_ + "/program.py"; }
    std::string mpl_dir() const { return path_ + "/mpl"; }

    /**
     * @brief 删除目录（可重复调用）
     */
    void remove() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            PLOG_WARN << "Failed to remove scratch directory " << path_ << ": " << ec.message();
        } else {
            PLOG_DEBUG << "Removed scratch directory " << path_;
        }
        path_.clear();
    }
};

} // namespace sandbox
} // namespace plot

#endif // PLOT_SANDBOX_SCRATCH_DIR_H
