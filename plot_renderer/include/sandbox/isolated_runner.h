/**
 * @file isolated_runner.h
 * @brief 隔离执行器
 *
 * 把程序文本写入私有临时目录，用解释器在独立进程中执行，
 * 超时后强制终止，并在任何路径上删除临时目录。
 */

#ifndef PLOT_SANDBOX_ISOLATED_RUNNER_H
#define PLOT_SANDBOX_ISOLATED_RUNNER_H

#include <string>
#include <chrono>
#include <cmath>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/render_logger.h"
#include "sandbox/scratch_dir.h"
#include "sandbox/process.h"

namespace plot {
namespace sandbox {

class IsolatedRunner {
private:
    std::string runtime_;        ///< 已解析的解释器路径
    std::string scratch_root_;   ///< 临时目录根，空表示系统临时目录

public:
    IsolatedRunner(const std::string &runtime, const std::string &scratch_root = "")
        : runtime_(runtime), scratch_root_(scratch_root) {}

    const std::string& runtime() const { return runtime_; }

    /**
     * @brief 执行程序文本
     * @param program_text 完整的程序源码
     * @param timeout_seconds 墙钟超时（秒）
     * @return 进程输出；超时体现在 ProcessOutcome::timed_out 中
     */
    Result<ProcessOutcome> run(const std::string &program_text, double timeout_seconds) const {
        PLOT_TRY_UNWRAP(scratch, ScratchDir::create(scratch_root_));

        if (!write_file(scratch.program_path(), program_text)) {
            return PLOT_ERROR(ErrorCode::FILE_WRITE_ERROR,
                              "Cannot write " + scratch.program_path());
        }

        auto timeout = std::chrono::milliseconds(
            static_cast<long long>(std::ceil(timeout_seconds * 1000.0)));

        PLOG_INFO << "Running " << runtime_ << " in " << scratch.path()
                  << " (timeout " << timeout.count() << " ms)";

        auto outcome = Process(runtime_)
                           .arg(scratch.program_path())
                           .work_dir(scratch.path())
                           .env("MPLCONFIGDIR", scratch.mpl_dir())
                           .env("XDG_CACHE_HOME", scratch.mpl_dir())
                           .env("MPLBACKEND", "Agg")
                           .env("PYTHONDONTWRITEBYTECODE", "1")
                           .run(timeout);

        if (outcome.ok()) {
            const ProcessOutcome &o = outcome.value();
            PLOG_INFO << "Worker finished: " << o.status
                      << " exit_code=" << o.exit_code
                      << " time=" << o.real_time_ms << "ms"
                      << (o.timed_out ? " (timed out)" : "");
        } else {
            PLOG_ERROR << "Worker failed to run: " << outcome.error().to_string();
        }
        return outcome;
    }
};

} // namespace sandbox
} // namespace plot

#endif // PLOT_SANDBOX_ISOLATED_RUNNER_H
