/**
 * @file renderer.h
 * @brief 渲染流水线
 *
 * validate -> synthesize -> run -> extract -> archive -> return
 *
 * 用法：
 *   auto renderer = Renderer::create(config);
 *   auto result = renderer.value().render(params);
 */

#ifndef PLOT_CORE_RENDERER_H
#define PLOT_CORE_RENDERER_H

#include <string>
#include <utility>

#include "core/error.h"
#include "core/types.h"
#include "core/config.h"
#include "core/render_logger.h"
#include "core/synthesizer.h"
#include "core/extractor.h"
#include "core/archiver.h"
#include "sandbox/runtime.h"
#include "sandbox/isolated_runner.h"

namespace plot {

class Renderer {
private:
    Synthesizer synthesizer_;
    sandbox::IsolatedRunner runner_;
    ResultExtractor extractor_;
    ArtifactArchiver archiver_;

public:
    Renderer(Synthesizer synthesizer,
             sandbox::IsolatedRunner runner,
             ResultExtractor extractor,
             ArtifactArchiver archiver)
        : synthesizer_(std::move(synthesizer)),
          runner_(std::move(runner)),
          extractor_(std::move(extractor)),
          archiver_(std::move(archiver)) {}

    /**
     * @brief 按配置构造渲染器
     *
     * 解释器找不到时返回 RUNTIME_NOT_FOUND；归档根目录创建失败只记录警告。
     */
    static Result<Renderer> create(const RendererConfig &config) {
        PLOT_TRY_UNWRAP(runtime, sandbox::resolve_runtime(config.python_bin));
        MLOG_INFO << "Using interpreter " << runtime;

        ArtifactArchiver archiver(config.artifact_root);
        auto init = archiver.init();
        if (init.is_error()) {
            MLOG_WARN << "Artifact archival disabled: " << init.error().to_string();
        }

        return Renderer(Synthesizer(),
                        sandbox::IsolatedRunner(runtime, config.scratch_root),
                        ResultExtractor(),
                        std::move(archiver));
    }

    const Synthesizer& synthesizer() const { return synthesizer_; }
    const sandbox::IsolatedRunner& runner() const { return runner_; }
    const ArtifactArchiver& archiver() const { return archiver_; }

    /**
     * @brief 渲染一次请求
     * @return 渲染结果（包括用户代码出错、空白图）；宿主侧失败返回错误
     */
    Result<RenderResult> render(const RenderParameters &params) const {
        // 1. 校验，不合法时不启动任何进程
        auto valid = params.validate();
        if (valid.is_error()) {
            MLOG_WARN << "Rejected request: " << valid.error().message();
            return valid.error();
        }

        MLOG_INFO << "Render request: " << params.width << "x" << params.height
                  << " in, " << params.dpi << " dpi, timeout " << params.timeout << "s, "
                  << params.code.size() << " bytes of code";

        // 2. 生成 worker 程序
        std::string program = synthesizer_.synthesize(params);

        // 3. 执行
        PLOT_TRY_UNWRAP(outcome, runner_.run(program, params.timeout));

        // 4. 超时
        if (outcome.timed_out) {
            MLOG_ERROR << "Renderer timed out after " << outcome.real_time_ms << " ms";
            return PLOT_ERROR(ErrorCode::RENDER_TIMEOUT, "Renderer timed out.");
        }

        // 5. 解析输出
        auto extracted = extractor_.extract(outcome);
        if (extracted.is_error()) {
            MLOG_ERROR << "Extraction failed: " << extracted.error().to_string();
            return extracted.error();
        }
        RenderResult result = std::move(extracted.value());

        // 6. 归档（失败不影响结果）
        auto archived = archiver_.persist(result.artifact_id, program, result.logs, result.png_base64);
        if (archived.is_error()) {
            ALOG_WARN << "Failed to archive " << result.artifact_id << ": "
                      << archived.error().to_string();
        }

        MLOG_INFO << "Render " << result.artifact_id << " finished: " << result.outcome()
                  << (result.png_base64 ? ", png" : "")
                  << (result.svg_base64 ? ", svg" : "");
        return result;
    }
};

} // namespace plot

#endif // PLOT_CORE_RENDERER_H
