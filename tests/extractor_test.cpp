/**
 * @file extractor_test.cpp
 * @brief 结果提取测试
 */

#include <gtest/gtest.h>

#include "core/extractor.h"

using namespace plot;

namespace {

ProcessOutcome finished(const std::string &out, const std::string &err = "", int exit_code = 0) {
    ProcessOutcome o;
    o.stdout_text = out;
    o.stderr_text = err;
    o.exit_code = exit_code;
    o.status = exit_code == 0 ? RunStatus::OK : RunStatus::RUNTIME_ERROR;
    return o;
}

ResultExtractor fixed_extractor() {
    return ResultExtractor([] { return std::string("fixed-id"); });
}

} // namespace

TEST(ExtractorTest, TimedOutProcessIsNeverParsed) {
    ProcessOutcome o = finished("{\"png\": null, \"svg\": null, \"logs\": \"\", \"error\": null}");
    o.timed_out = true;
    o.status = RunStatus::TIME_LIMIT;
    auto res = fixed_extractor().extract(o);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::RENDER_TIMEOUT);
}

TEST(ExtractorTest, EmptyOutputReportsStderr) {
    auto res = fixed_extractor().extract(finished(" \n\t", "  Traceback: boom\n", 1));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::EMPTY_OUTPUT);
    EXPECT_EQ(res.error().message(), "Renderer produced no output. stderr=Traceback: boom");
}

TEST(ExtractorTest, MalformedLastLine) {
    auto res = fixed_extractor().extract(finished("{\"png\": null}\nnot json at all\n"));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code(), ErrorCode::MALFORMED_PAYLOAD);
    EXPECT_EQ(res.error().message(), "Invalid renderer payload: not json at all");
}

TEST(ExtractorTest, PayloadMustBeAnObjectWithStringFields) {
    for (const char *line : {"[1, 2, 3]", "42", "{\"png\": 5}", "{\"logs\": [\"a\"]}",
                             "{\"error\": true}", "{\"png\": null"}) {
        auto res = fixed_extractor().extract(finished(line));
        ASSERT_TRUE(res.is_error()) << line;
        EXPECT_EQ(res.error().code(), ErrorCode::MALFORMED_PAYLOAD) << line;
    }
}

TEST(ExtractorTest, OnlyLastLineIsThePayload) {
    std::string out =
        "user print\n"
        "{\"png\": \"ignored\", \"svg\": null, \"logs\": \"old\", \"error\": null}\n"
        "{\"png\": \"QQ==\", \"svg\": \"Qg==\", \"logs\": \"hello\", \"error\": null}\n\n";
    auto res = fixed_extractor().extract(finished(out));
    ASSERT_TRUE(res.ok()) << res.error().to_string();

    const RenderResult &r = res.value();
    ASSERT_TRUE(r.png_base64.has_value());
    EXPECT_EQ(*r.png_base64, "QQ==");
    ASSERT_TRUE(r.svg_base64.has_value());
    EXPECT_EQ(*r.svg_base64, "Qg==");
    EXPECT_EQ(r.logs, "hello");
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(r.outcome(), Outcome::NONE);
    EXPECT_EQ(r.artifact_id, "fixed-id");
    EXPECT_EQ(r.png_bytes().value(), "A");
}

TEST(ExtractorTest, StderrIsAppendedToLogs) {
    std::string payload = "{\"png\": \"QQ==\", \"svg\": null, \"logs\": \"hello\", \"error\": null}";
    auto res = fixed_extractor().extract(finished(payload, "\nwarning: x\n"));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().logs, "hello\nwarning: x");

    payload = "{\"png\": \"QQ==\", \"svg\": null, \"logs\": \"\", \"error\": null}";
    res = fixed_extractor().extract(finished(payload, "warning: x"));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().logs, "warning: x");

    payload = "{\"png\": \"QQ==\", \"svg\": null, \"logs\": null, \"error\": null}";
    res = fixed_extractor().extract(finished(payload, "   "));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().logs, "");
}

TEST(ExtractorTest, OutcomeTagIsTakenVerbatim) {
    auto res = fixed_extractor().extract(finished(
        "{\"png\": \"QQ==\", \"svg\": null, \"logs\": \"trace\", \"error\": \"EXECUTION_ERROR\"}", "", 1));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().outcome(), Outcome::EXECUTION_ERROR);
    EXPECT_FALSE(res.value().svg_base64.has_value());

    res = fixed_extractor().extract(finished(
        "{\"png\": \"QQ==\", \"svg\": \"Qg==\", \"logs\": \"\", \"error\": \"BLANK_PLOT\"}"));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().outcome(), Outcome::BLANK_PLOT);
    EXPECT_EQ(*res.value().error, "BLANK_PLOT");

    res = fixed_extractor().extract(finished(
        "{\"png\": null, \"svg\": null, \"logs\": \"\", \"error\": \"SOMETHING_NEW\"}"));
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().outcome(), Outcome::OTHER);
    EXPECT_FALSE(res.value().png_bytes().has_value());
}

TEST(ExtractorTest, DefaultGeneratorGivesFreshIds) {
    ResultExtractor extractor;
    std::string payload = "{\"png\": null, \"svg\": null, \"logs\": \"\", \"error\": null}";
    auto a = extractor.extract(finished(payload));
    auto b = extractor.extract(finished(payload));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value().artifact_id.size(), 32u);
    EXPECT_NE(a.value().artifact_id, b.value().artifact_id);
}
