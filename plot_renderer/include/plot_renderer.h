/**
 * @file plot_renderer.h
 * @brief 绘图渲染引擎主头文件
 *
 * 在独立进程中执行用户提交的 matplotlib 脚本，得到 PNG/SVG、日志和结果分类。
 *
 * 使用方式：
 *   #include "plot_renderer.h"
 *   using namespace plot;
 */

#ifndef PLOT_RENDERER_H
#define PLOT_RENDERER_H

// 核心模块
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/logger.h"
#include "core/render_logger.h"
#include "core/synthesizer.h"
#include "core/extractor.h"
#include "core/archiver.h"
#include "core/renderer.h"
#include "core/request.h"

// 沙箱
#include "sandbox/runtime.h"
#include "sandbox/scratch_dir.h"
#include "sandbox/process.h"
#include "sandbox/isolated_runner.h"

namespace plot {

/**
 * @brief 按配置初始化日志系统
 */
inline void init_logging(const RendererConfig &config) {
    LOG_SET_LEVEL(config.log_level);
    render_log().init(config.log_level, config.log_color, config.log_dir);
}

} // namespace plot

#endif // PLOT_RENDERER_H
