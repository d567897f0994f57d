#include "execution/output_parser.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using scriptbox::execution::ParseOutput;
using scriptbox::execution::TruncationNotice;
using scriptbox::sandbox::SandboxRun;

SandboxRun CleanRun(const std::string& output, const std::string& result) {
    SandboxRun run;
    run.exit_code = 0;
    run.output = output;
    run.result_channel = result;
    return run;
}

// NOLINTNEXTLINE
TEST(OutputParser, SeparatesPrintedLinesFromResult) {
    const auto parsed = ParseOutput(CleanRun("Processing...\r\ndone\n", "15"), 1024);
    EXPECT_THAT(parsed.informational_lines, ElementsAre("Processing...", "done"));
    ASSERT_TRUE(parsed.result.has_value());
    EXPECT_EQ(*parsed.result, 15);
    EXPECT_EQ(parsed.InformationalText(), "Processing...\ndone");
    EXPECT_TRUE(parsed.result_error.empty());
}

// NOLINTNEXTLINE
TEST(OutputParser, PrintedJsonIsNotMistakenForTheResult) {
    const auto parsed = ParseOutput(CleanRun("{\"fake\": true}\n", "\"real\""), 1024);
    ASSERT_TRUE(parsed.result.has_value());
    EXPECT_EQ(*parsed.result, "real");
    EXPECT_THAT(parsed.informational_lines, ElementsAre("{\"fake\": true}"));
}

// NOLINTNEXTLINE
TEST(OutputParser, NullResultIsAResult) {
    const auto parsed = ParseOutput(CleanRun("", "null"), 1024);
    ASSERT_TRUE(parsed.result.has_value());
    EXPECT_TRUE(parsed.result->is_null());
    EXPECT_THAT(parsed.informational_lines, IsEmpty());
}

// NOLINTNEXTLINE
TEST(OutputParser, MissingResultChannel) {
    SandboxRun run;
    run.exit_code = 0;
    const auto parsed = ParseOutput(run, 1024);
    EXPECT_FALSE(parsed.result.has_value());
    EXPECT_EQ(parsed.result_error, "main() did not return a result");
}

// NOLINTNEXTLINE
TEST(OutputParser, UndecodableResult) {
    const auto parsed = ParseOutput(CleanRun("", "{\"a\": "), 1024);
    EXPECT_FALSE(parsed.result.has_value());
    EXPECT_EQ(parsed.result_error, "main() returned a value that could not be decoded");
}

// NOLINTNEXTLINE
TEST(OutputParser, OversizedResult) {
    SandboxRun run;
    run.exit_code = 0;
    run.result_overflow = true;
    const auto parsed = ParseOutput(run, 1024);
    EXPECT_FALSE(parsed.result.has_value());
    EXPECT_EQ(parsed.result_error, "main() returned a value that is too large");
}

// NOLINTNEXTLINE
TEST(OutputParser, FailedRunIgnoresResultChannel) {
    auto run = CleanRun("partial\n", "1");
    run.exit_code = 1;
    const auto parsed = ParseOutput(run, 1024);
    EXPECT_FALSE(parsed.result.has_value());
    EXPECT_TRUE(parsed.result_error.empty());
    EXPECT_THAT(parsed.informational_lines, ElementsAre("partial"));

    auto timed_out = CleanRun("", "1");
    timed_out.timed_out = true;
    EXPECT_FALSE(ParseOutput(timed_out, 1024).result.has_value());
}

// NOLINTNEXTLINE
TEST(OutputParser, TruncatedOutputGetsNotice) {
    auto run = CleanRun("aaaa", "true");
    run.output_truncated = true;
    const auto parsed = ParseOutput(run, 4);
    EXPECT_TRUE(parsed.truncated);
    EXPECT_THAT(parsed.informational_lines, ElementsAre("aaaa", TruncationNotice(4)));
    EXPECT_EQ(TruncationNotice(4), "[output truncated after 4 bytes]");
}

}  // namespace
