/**
 * @file renderer_test.cpp
 * @brief 渲染流水线测试
 *
 * 用 shell 脚本代替解释器，输出预先写好的结果文档。
 */

#include <gtest/gtest.h>
#include <chrono>

#include "core/renderer.h"
#include "test_util.h"

using namespace plot;
using plot_test::list_dir;

namespace {

const char *const PNG_SIGNATURE_B64 = "iVBORw0KGgo=";
const char *const SVG_B64 = "PHN2Zy8+";

} // namespace

class RendererTest : public plot_test::TempDirTest {
protected:
    void SetUp() override {
        plot_test::TempDirTest::SetUp();
        make_dir("scratch");
        make_dir("artifacts");
    }

    /**
     * @brief 写一个假解释器：记录调用，向 stderr 输出 prelude，向 stdout 输出 payload
     */
    std::string fake_runtime(const std::string &payload, const std::string &prelude = "",
                             int exit_code = 0) const {
        std::string body =
            "touch '" + path("spawned") + "'\n"
            "dirname \"$1\" > '" + path("scratch.path") + "'\n" +
            prelude +
            "cat <<'PAYLOAD'\n" + payload + "\nPAYLOAD\n"
            "exit " + std::to_string(exit_code) + "\n";
        return write_script("fake-python", body);
    }

    Renderer make_renderer(const std::string &runtime,
                           IdGenerator ids = random_hex_id) const {
        return Renderer(Synthesizer(),
                        sandbox::IsolatedRunner(runtime, path("scratch")),
                        ResultExtractor(std::move(ids)),
                        ArtifactArchiver(path("artifacts")));
    }

    static RenderParameters params(const std::string &code, double timeout = 10) {
        return RenderParameters(code, 12, 8, 150, timeout);
    }
};

TEST_F(RendererTest, SuccessfulRenderIsArchived) {
    std::string payload = std::string("{\"png\": \"") + PNG_SIGNATURE_B64 + "\", \"svg\": \"" +
                          SVG_B64 + "\", \"logs\": \"worker logs\", \"error\": null}";
    Renderer renderer = make_renderer(fake_runtime(payload, "echo noise\n"));
    auto p = params("plt.plot([1, 2, 3])");

    auto res = renderer.render(p);
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    const RenderResult &r = res.value();

    EXPECT_EQ(r.outcome(), Outcome::NONE);
    EXPECT_EQ(*r.png_base64, PNG_SIGNATURE_B64);
    EXPECT_EQ(*r.svg_base64, SVG_B64);
    EXPECT_EQ(r.logs, "worker logs");
    EXPECT_EQ(r.png_bytes().value(), std::string("\x89PNG\r\n\x1a\n", 8));
    ASSERT_EQ(r.artifact_id.size(), 32u);

    std::string dir = "artifacts/" + r.artifact_id;
    EXPECT_EQ(read(dir + "/program.py"), renderer.synthesizer().synthesize(p));
    EXPECT_EQ(read(dir + "/logs.txt"), "worker logs");
    EXPECT_EQ(read(dir + "/plot.png"), std::string("\x89PNG\r\n\x1a\n", 8));
}

TEST_F(RendererTest, WorkerRunsInPrivateScratchDirectory) {
    std::string prelude =
        "echo \"mpl=$MPLCONFIGDIR backend=$MPLBACKEND\" >&2\n"
        "test -f \"$1\" && echo \"program present\" >&2\n"
        "test -d \"$MPLCONFIGDIR\" && echo \"config dir present\" >&2\n";
    Renderer renderer = make_renderer(fake_runtime(
        "{\"png\": null, \"svg\": null, \"logs\": \"\", \"error\": null}", prelude));

    auto res = renderer.render(params("x = 1"));
    ASSERT_TRUE(res.ok()) << res.error().to_string();

    std::string scratch = trim(read("scratch.path"));
    EXPECT_EQ(scratch.rfind(path("scratch/plot-worker-"), 0), 0u) << scratch;
    EXPECT_NE(res.value().logs.find("mpl=" + scratch + "/mpl backend=Agg"), std::string::npos)
        << res.value().logs;
    EXPECT_NE(res.value().logs.find("program present"), std::string::npos);
    EXPECT_NE(res.value().logs.find("config dir present"), std::string::npos);

    // 临时目录在返回前被删除
    EXPECT_FALSE(dir_exists(scratch));
    EXPECT_TRUE(list_dir(path("scratch")).empty());
}

TEST_F(RendererTest, InvalidParametersNeverSpawn) {
    Renderer renderer = make_renderer(fake_runtime("{}"));

    auto res = renderer.render(params(" \n\t "));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EMPTY_CODE);
    EXPECT_EQ(res.error().message(), "Submitted code is empty.");

    res = renderer.render(RenderParameters("x = 1", 12, 8, 10, 10));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::PARAMETER_OUT_OF_RANGE);

    EXPECT_FALSE(file_exists(path("spawned")));
    EXPECT_TRUE(list_dir(path("artifacts")).empty());
}

TEST_F(RendererTest, TimeoutIsReportedAndNothingIsArchived) {
    Renderer renderer = make_renderer(fake_runtime("{}", "sleep 30\n"));

    auto start = std::chrono::steady_clock::now();
    auto res = renderer.render(params("import time; time.sleep(30)", 1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::RENDER_TIMEOUT);
    EXPECT_EQ(res.error().message(), "Renderer timed out.");
    EXPECT_EQ(res.error().status(), 504);
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    EXPECT_TRUE(file_exists(path("spawned")));
    EXPECT_TRUE(list_dir(path("scratch")).empty());
    EXPECT_TRUE(list_dir(path("artifacts")).empty());
}

TEST_F(RendererTest, EmptyOutputIsAnError) {
    Renderer renderer = make_renderer(write_script("fake-python", "echo 'oops' >&2\nexit 1\n"));
    auto res = renderer.render(params("x = 1"));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EMPTY_OUTPUT);
    EXPECT_EQ(res.error().message(), "Renderer produced no output. stderr=oops");
    EXPECT_TRUE(list_dir(path("artifacts")).empty());
    EXPECT_TRUE(list_dir(path("scratch")).empty());
}

TEST_F(RendererTest, MalformedPayloadIsAnError) {
    Renderer renderer = make_renderer(fake_runtime("not json"));
    auto res = renderer.render(params("x = 1"));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::MALFORMED_PAYLOAD);
    EXPECT_EQ(res.error().message(), "Invalid renderer payload: not json");
    EXPECT_EQ(res.error().status(), 500);
    EXPECT_TRUE(list_dir(path("artifacts")).empty());
}

TEST_F(RendererTest, ExecutionErrorIsAResultNotAFailure) {
    Renderer renderer = make_renderer(
        fake_runtime("{\"png\": \"QQ==\", \"svg\": null, "
                     "\"logs\": \"Traceback\\nValueError: boom\", \"error\": \"EXECUTION_ERROR\"}",
                     "", 1),
        [] { return std::string("exec-error-id"); });

    auto res = renderer.render(params("raise ValueError('boom')"));
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().outcome(), Outcome::EXECUTION_ERROR);
    EXPECT_FALSE(res.value().svg_base64.has_value());
    EXPECT_EQ(res.value().logs, "Traceback\nValueError: boom");
    EXPECT_EQ(res.value().artifact_id, "exec-error-id");
    EXPECT_EQ(read("artifacts/exec-error-id/plot.png"), "A");
    EXPECT_EQ(read("artifacts/exec-error-id/logs.txt"), "Traceback\nValueError: boom");
}

TEST_F(RendererTest, ArchiveFailureDoesNotFailTheRender) {
    make_dir("artifacts/taken");
    Renderer renderer = make_renderer(
        fake_runtime("{\"png\": \"QQ==\", \"svg\": null, \"logs\": \"\", \"error\": \"BLANK_PLOT\"}"),
        [] { return std::string("taken"); });

    auto res = renderer.render(params("fig = plt.figure()"));
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().outcome(), Outcome::BLANK_PLOT);
    EXPECT_EQ(res.value().artifact_id, "taken");
    EXPECT_TRUE(list_dir(path("artifacts/taken")).empty());
}

TEST_F(RendererTest, CreateFailsWithoutInterpreter) {
    RendererConfig config;
    config.artifact_root = path("artifacts");
    config.python_bin = path("no-such-python");
    auto res = Renderer::create(config);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::RUNTIME_NOT_FOUND);
}

TEST_F(RendererTest, CreateToleratesUnusableArtifactRoot) {
    write("blocked", "file in the way");
    RendererConfig config;
    config.artifact_root = path("blocked/artifacts");
    config.scratch_root = path("scratch");
    config.python_bin = fake_runtime("{\"png\": null, \"svg\": null, \"logs\": \"ok\", \"error\": null}");

    auto renderer = Renderer::create(config);
    ASSERT_TRUE(renderer.ok()) << renderer.error().to_string();
    EXPECT_EQ(renderer.value().runner().runtime(), config.python_bin);

    auto res = renderer.value().render(params("x = 1"));
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().logs, "ok");
}

TEST_F(RendererTest, CreateInitializesArtifactRoot) {
    RendererConfig config;
    config.artifact_root = path("nested/artifacts");
    config.python_bin = fake_runtime("{}");
    auto renderer = Renderer::create(config);
    ASSERT_TRUE(renderer.ok());
    EXPECT_TRUE(dir_exists(path("nested/artifacts")));
}

TEST_F(RendererTest, RelativeScratchRootAndRuntime) {
    fake_runtime("{\"png\": null, \"svg\": null, \"logs\": \"relative ok\", \"error\": null}",
                 "test -f \"$1\" || echo \"missing $1\" >&2\n");
    plot_test::ScopedCwd cwd(work_dir);

    RendererConfig config;
    config.artifact_root = "artifacts";
    config.scratch_root = "scratch";
    config.python_bin = "./fake-python";

    auto renderer = Renderer::create(config);
    ASSERT_TRUE(renderer.ok()) << renderer.error().to_string();
    EXPECT_EQ(renderer.value().runner().runtime()[0], '/');

    auto res = renderer.value().render(params("x = 1"));
    ASSERT_TRUE(res.ok()) << res.error().to_string();
    EXPECT_EQ(res.value().logs, "relative ok");

    std::string scratch = trim(read("scratch.path"));
    ASSERT_FALSE(scratch.empty());
    EXPECT_EQ(scratch[0], '/');
    EXPECT_FALSE(dir_exists(scratch));
    EXPECT_TRUE(list_dir(path("scratch")).empty());
    EXPECT_TRUE(file_exists(path("artifacts/" + res.value().artifact_id + "/program.py")));
}
