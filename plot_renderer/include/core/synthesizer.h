/**
 * @file synthesizer.h
 * @brief worker 程序生成器
 *
 * 根据渲染参数生成一个独立的 Python 程序。该程序：
 * - 在受控的命名空间中执行用户脚本，输出重定向到内存日志
 * - 从脚本状态中找出要渲染的图（必要时调用约定的入口函数）
 * - 检测空白图，容忍出错的 FuncFormatter
 * - 用户代码出错时渲染一张错误占位图
 * - 在真实 stdout 的最后一行打印 JSON 结果
 *
 * 生成结果只取决于参数，相同参数得到逐字节相同的程序。
 */

#ifndef PLOT_CORE_SYNTHESIZER_H
#define PLOT_CORE_SYNTHESIZER_H

#include <string>
#include <vector>
#include <map>
#include <cctype>
#include <cstdio>

#include "core/types.h"
#include "core/utils.h"

namespace plot {

//==============================================================================
// 字面量与模板
//==============================================================================

/**
 * @brief 生成 Python bytes 字面量
 *
 * 可打印 ASCII 原样输出，引号、反斜杠和其他所有字节写成 \xNN，
 * 因此结果总是单行，不可能提前闭合字面量。
 */
inline std::string python_bytes_literal(const std::string &data) {
    static const char hex[] = "0123456789abcdef";
    std::string out = "b'";
    out.reserve(data.size() + 3);
    for (unsigned char c : data) {
        if (c >= 0x20 && c < 0x7f && c != '\'' && c != '\\') {
            out += static_cast<char>(c);
        } else {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0xF];
        }
    }
    out += '\'';
    return out;
}

/**
 * @brief 生成 Python 字符串元组字面量，如 ("a", "b")
 */
inline std::string python_str_tuple(const std::vector<std::string> &items) {
    std::string out = "(";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += '"';
        for (char c : items[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    if (items.size() == 1) out += ",";
    out += ")";
    return out;
}

/**
 * @brief 单遍替换模板中的 {name} 占位符
 *
 * 只替换 values 中存在的名字；替换进来的文本不会再被扫描。
 */
inline std::string substitute(const std::string &tmpl,
                              const std::map<std::string, std::string> &values) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t j = i + 1;
            while (j < tmpl.size() &&
                   (std::isalnum(static_cast<unsigned char>(tmpl[j])) || tmpl[j] == '_')) {
                j++;
            }
            if (j < tmpl.size() && tmpl[j] == '}' && j > i + 1) {
                auto it = values.find(tmpl.substr(i + 1, j - i - 1));
                if (it != values.end()) {
                    out += it->second;
                    i = j + 1;
                    continue;
                }
            }
        }
        out += tmpl[i];
        i++;
    }
    return out;
}

//==============================================================================
// worker 模板
//==============================================================================

namespace detail {

// 1x1 白色 PNG，错误占位图也无法绘制时使用
const char* const FALLBACK_PNG_BASE64 =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAIAAACQd1PeAAAADElEQVR4nGP4//8/AAX+Av4N70a4AAAAAElFTkSuQmCC";

const char* const WORKER_TEMPLATE = R"PY(import base64
import io
import json
import sys
import textwrap
import traceback
import warnings
from contextlib import redirect_stdout, redirect_stderr

warnings.filterwarnings("ignore", message=".*Glyph.*missing from.*")
warnings.filterwarnings("ignore", message=".*FigureCanvasAgg is non-interactive.*")
warnings.filterwarnings("ignore", message=".*font cache.*")

import matplotlib
matplotlib.use("Agg")
import matplotlib.pyplot as plt
import matplotlib.ticker as mticker
from matplotlib import _pylab_helpers
from matplotlib.axes import Axes
from matplotlib.backends.backend_agg import FigureCanvasAgg
from matplotlib.figure import Figure
import numpy as np
import pandas as pd
import scipy

FIG_WIDTH = {width}
FIG_HEIGHT = {height}
FIG_DPI = {dpi}
BLANK_THRESHOLD = {blank_threshold}
ENTRY_POINTS = {entry_points}
TRACE_TAIL_LINES = {trace_tail_lines}
TRACE_WRAP_WIDTH = {trace_wrap_width}
USER_CODE = {user_code}.decode("utf-8", "replace")
FALLBACK_PNG = {fallback_png}

plt.rcParams["font.family"] = ["DejaVu Sans", "sans-serif"]
plt.rcParams["mathtext.fontset"] = "dejavusans"
plt.rcParams["figure.figsize"] = (FIG_WIDTH, FIG_HEIGHT)
plt.rcParams["figure.dpi"] = FIG_DPI
plt.rcParams["savefig.facecolor"] = "white"
plt.rcParams["figure.facecolor"] = "white"

# rcParams for the error placeholder, taken before user code runs
RC_DEFAULTS = dict(matplotlib.rcParams.copy())
RC_DEFAULTS.pop("backend", None)

namespace = {
    "__builtins__": __builtins__,
    "__name__": "__main__",
    "__file__": "student_code.py",
    "__package__": None,
    "plt": plt,
    "np": np,
    "pd": pd,
    "scipy": scipy,
}


def _noop(*args, **kwargs):
    return None


# Figures must survive until they are captured.
plt.close = _noop
plt.clf = _noop
plt.cla = _noop


def _figure_with_axes(candidate):
    if isinstance(candidate, Figure):
        return candidate if candidate.axes else None
    if isinstance(candidate, Axes):
        fig = candidate.figure
        if fig is not None and not isinstance(fig, Figure):
            fig = getattr(fig, "figure", None)
        if isinstance(fig, Figure) and fig.axes:
            return fig
    return None


def _active_figure():
    managers = _pylab_helpers.Gcf.get_all_fig_managers()
    if managers:
        return managers[-1].canvas.figure
    return plt.gcf()


def _make_attempt(name):
    def attempt():
        fn = namespace.get(name)
        if not callable(fn):
            return None
        try:
            candidate = fn()
        except TypeError:
            return None
        found = _figure_with_axes(candidate)
        if found is not None:
            return found
        if isinstance(candidate, (list, tuple)):
            for item in candidate:
                found = _figure_with_axes(item)
                if found is not None:
                    return found
        active = _active_figure()
        return active if active.axes else None
    return attempt


ATTEMPTS = [_make_attempt(name) for name in ENTRY_POINTS]


def _discover_figure():
    fig = _active_figure()
    if fig.axes:
        return fig
    for attempt in ATTEMPTS:
        found = attempt()
        if found is not None:
            return found
    return _active_figure()


def _execute():
    try:
        exec(compile(USER_CODE, "student_code.py", "exec"), namespace)
        return ("ok", _discover_figure())
    except (Exception, SystemExit):
        return ("error", traceback.format_exc())


formatter_errors = []


def _wrap_formatter(formatter):
    if not isinstance(formatter, mticker.FuncFormatter):
        return formatter
    original = formatter.func

    def _safe(value, pos=None):
        try:
            return original(value, pos)
        except Exception as exc:
            if not formatter_errors:
                formatter_errors.append(
                    "FORMATTER_ERROR suppressed: " + type(exc).__name__ + ": " + str(exc)
                )
            return ""

    return mticker.FuncFormatter(_safe)


def _contain_formatters(fig):
    for ax in fig.axes:
        axes = [ax.xaxis, ax.yaxis]
        zaxis = getattr(ax, "zaxis", None)
        if zaxis is not None:
            axes.append(zaxis)
        for axis in axes:
            axis.set_major_formatter(_wrap_formatter(axis.get_major_formatter()))
            axis.set_minor_formatter(_wrap_formatter(axis.get_minor_formatter()))


def _blank_stats(fig):
    canvas = FigureCanvasAgg(fig)
    canvas.draw()
    rgb = np.asarray(canvas.buffer_rgba())[..., :3]
    pixel_std = float(rgb.std())
    h, w, _ = rgb.shape
    y0, y1 = int(h * 0.2), int(h * 0.8)
    x0, x1 = int(w * 0.2), int(w * 0.8)
    center_std = float(rgb[y0:y1, x0:x1].std()) if (y1 > y0 and x1 > x0) else pixel_std
    return pixel_std, center_std


def _add_placeholder(fig):
    ax = fig.add_subplot(111)
    ax.set_axis_off()
    ax.text(0.5, 0.55, "No plot was generated", ha="center", va="center", fontsize=14)


def _encode(fig, fmt):
    buffer = io.BytesIO()
    fig.savefig(buffer, format=fmt, bbox_inches="tight")
    return base64.b64encode(buffer.getvalue()).decode("ascii")


def _render(fig):
    stats = None
    if not fig.axes:
        # Measured before the placeholder text so an empty canvas still counts as blank.
        stats = _blank_stats(fig)
        _add_placeholder(fig)
    _contain_formatters(fig)
    if stats is None:
        stats = _blank_stats(fig)
    return _encode(fig, "png"), _encode(fig, "svg"), stats


def _error_png(trace):
    with matplotlib.rc_context(rc=RC_DEFAULTS):
        fig = Figure(figsize=(FIG_WIDTH, FIG_HEIGHT), dpi=FIG_DPI, facecolor="white")
        FigureCanvasAgg(fig)
        ax = fig.add_subplot(111)
        ax.set_axis_off()
        tail = "\n".join(trace.strip().splitlines()[-TRACE_TAIL_LINES:])
        message = "EXECUTION_ERROR (rendered placeholder)\n\n" + tail
        message = textwrap.fill(
            message, width=TRACE_WRAP_WIDTH, replace_whitespace=False, drop_whitespace=False
        )
        ax.text(
            0.02,
            0.98,
            message.replace("$", "\\$"),
            ha="left",
            va="top",
            fontsize=10,
            family="monospace",
            color="#b91c1c",
            transform=ax.transAxes,
        )
        return _encode(fig, "png")


log_stream = io.StringIO()
payload = {"png": None, "svg": None, "logs": "", "error": None}

with redirect_stdout(log_stream), redirect_stderr(log_stream):
    tag, value = _execute()
    if tag == "ok":
        try:
            png, svg, (pixel_std, center_std) = _render(value)
        except Exception:
            tag, value = "error", traceback.format_exc()

    if tag == "ok":
        logs = log_stream.getvalue()
        if formatter_errors:
            logs = logs + "\n" + formatter_errors[0]
        payload["png"] = png
        payload["svg"] = svg
        if pixel_std < BLANK_THRESHOLD or center_std < BLANK_THRESHOLD:
            payload["error"] = "BLANK_PLOT"
            logs = logs + "\nBLANK_PLOT_DETECTED pixel_std={:.4f} center_std={:.4f}".format(
                pixel_std, center_std
            )
        payload["logs"] = logs
    else:
        payload["error"] = "EXECUTION_ERROR"
        payload["logs"] = log_stream.getvalue() + "\n" + value
        try:
            payload["png"] = _error_png(value)
        except Exception:
            payload["logs"] += "\nERROR_PNG_FALLBACK " + traceback.format_exc().strip().splitlines()[-1]
            payload["png"] = FALLBACK_PNG

sys.__stdout__.write("\n" + json.dumps(payload) + "\n")
sys.__stdout__.flush()
sys.exit(0 if payload["error"] is None else 1)
)PY";

} // namespace detail

//==============================================================================
// Synthesizer
//==============================================================================

/**
 * @brief worker 行为参数（与请求无关的常量）
 */
struct WorkerOptions {
    double blank_threshold = 2.0;     ///< 像素标准差低于此值视为空白
    int trace_tail_lines = 18;        ///< 错误占位图中保留的 traceback 行数
    int trace_wrap_width = 88;        ///< 错误占位图的折行宽度
    std::vector<std::string> entry_points = {
        "create_plot",
        "create_figure",
        "create_replication",
        "build_plot",
        "build_figure",
        "generate_plot",
        "main",
    };
};

class Synthesizer {
private:
    WorkerOptions options_;

public:
    Synthesizer() = default;
    explicit Synthesizer(const WorkerOptions &options) : options_(options) {}

    const WorkerOptions& options() const { return options_; }

    /**
     * @brief 生成 worker 程序文本
     *
     * 不校验参数，调用方应先调用 RenderParameters::validate()。
     */
    std::string synthesize(const RenderParameters &params) const {
        std::map<std::string, std::string> values;
        values["width"] = float_literal(params.width);
        values["height"] = float_literal(params.height);
        values["dpi"] = to_string(params.dpi);
        values["blank_threshold"] = float_literal(options_.blank_threshold);
        values["entry_points"] = python_str_tuple(options_.entry_points);
        values["trace_tail_lines"] = to_string(options_.trace_tail_lines);
        values["trace_wrap_width"] = to_string(options_.trace_wrap_width);
        values["user_code"] = python_bytes_literal(normalize_newlines(params.code));
        values["fallback_png"] = "\"" + std::string(detail::FALLBACK_PNG_BASE64) + "\"";
        return substitute(detail::WORKER_TEMPLATE, values);
    }
};

} // namespace plot

#endif // PLOT_CORE_SYNTHESIZER_H
