#include <gtest/gtest.h>

#include "lpdispatch/job/CommandBuilder.hpp"
#include "lpdispatch/storage/impl/TempScratchStorage.hpp"
#include "TestHelpers.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace lpdispatch;
using namespace lpdispatch::job;
using namespace lpdispatch::test;

class CommandBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch = std::make_shared<FakeScratchStorage>();
        builder = std::make_unique<CommandBuilder>(scratch);
    }

    std::string buildOk(const JobOptions &options, const Content &content) {
        types::Result result = builder->build(options, content);
        EXPECT_TRUE(result.isSuccess()) << result.message;
        return result.commandLine.value_or("");
    }

    std::shared_ptr<FakeScratchStorage> scratch;
    std::unique_ptr<CommandBuilder> builder;
};

TEST_F(CommandBuilderTest, MinimalLpCommand) {
    EXPECT_EQ("lp '/srv/doc.pdf'", buildOk(JobOptions{}, Content::file("/srv/doc.pdf")));
}

TEST_F(CommandBuilderTest, MinimalLprCommand) {
    JobOptions options = JobOptionsBuilder().useLpr(true).build();
    EXPECT_EQ("lpr '/srv/doc.pdf'", buildOk(options, Content::file("/srv/doc.pdf")));
}

TEST_F(CommandBuilderTest, DestinationFlagFollowsVariant) {
    auto lp = buildOk(JobOptionsBuilder().destination("Office Printer").build(), Content::file("/a"));
    EXPECT_NE(std::string::npos, lp.find("-d 'Office Printer'")) << lp;

    auto lpr = buildOk(JobOptionsBuilder().useLpr(true).destination("Office Printer").build(), Content::file("/a"));
    EXPECT_NE(std::string::npos, lpr.find("-P 'Office Printer'")) << lpr;
}

TEST_F(CommandBuilderTest, CopiesRendering) {
    auto lp = buildOk(JobOptionsBuilder().copies(2).build(), Content::file("/a"));
    EXPECT_EQ("lp -n 2 '/a'", lp);

    auto lpr = buildOk(JobOptionsBuilder().useLpr(true).copies(2).build(), Content::file("/a"));
    EXPECT_EQ("lpr -#2 '/a'", lpr);
}

TEST_F(CommandBuilderTest, ZeroCopiesIsPassedThrough) {
    EXPECT_EQ("lp -n 0 '/a'", buildOk(JobOptionsBuilder().copies(0).build(), Content::file("/a")));
}

TEST_F(CommandBuilderTest, TitleIsEscapedEndToEnd) {
    auto cmd = buildOk(JobOptionsBuilder().useLpr(true).title("Q2 'Report'").build(), Content::file("/a"));
    EXPECT_NE(std::string::npos, cmd.find(R"(-J 'Q2 '"'"'Report'"'"'')")) << cmd;

    auto words = splitShellWords(cmd);
    ASSERT_EQ(4u, words.size());
    EXPECT_EQ("-J", words[1]);
    EXPECT_EQ("Q2 'Report'", words[2]);
}

TEST_F(CommandBuilderTest, LpTitleFlag) {
    auto cmd = buildOk(JobOptionsBuilder().title("Weekly").build(), Content::file("/a"));
    EXPECT_EQ("lp -t 'Weekly' '/a'", cmd);
}

TEST_F(CommandBuilderTest, JobOptionsArePassedRaw) {
    auto cmd = buildOk(JobOptionsBuilder().jobOption("sides", "two-sided-long-edge").build(), Content::file("/a"));
    EXPECT_NE(std::string::npos, cmd.find("-o sides=two-sided-long-edge")) << cmd;
    EXPECT_EQ(std::string::npos, cmd.find("'sides")) << cmd;
}

TEST_F(CommandBuilderTest, JobOptionsAreSortedByKey) {
    JobOptions options;
    options.jobOptions["z"] = "1";
    options.jobOptions["a"] = "2";

    EXPECT_EQ("lp -o a=2 -o z=1 '/a'", buildOk(options, Content::file("/a")));
}

TEST_F(CommandBuilderTest, FullLprCommandLayout) {
    JobOptions options = JobOptionsBuilder()
            .useLpr(true)
            .destination("Office Printer")
            .copies(2)
            .title("Q2 'Report'")
            .jobOption("sides", "two-sided-long-edge")
            .jobOption("media", "a4")
            .build();

    auto words = splitShellWords(buildOk(options, Content::file("/home/me/report 2.pdf")));
    std::vector<std::string> expected{
            "lpr", "-P", "Office Printer", "-#2", "-J", "Q2 'Report'",
            "-o", "media=a4", "-o", "sides=two-sided-long-edge", "/home/me/report 2.pdf"};
    EXPECT_EQ(expected, words);
}

TEST_F(CommandBuilderTest, HostileDestinationStaysOneWord) {
    auto cmd = buildOk(JobOptionsBuilder().destination("x'; rm -rf ~; echo '").build(), Content::file("/a"));
    auto words = splitShellWords(cmd);
    ASSERT_EQ(4u, words.size());
    EXPECT_EQ("x'; rm -rf ~; echo '", words[2]);
}

TEST_F(CommandBuilderTest, EmptyFilePathIsRejected) {
    types::Result result = builder->build(JobOptionsBuilder().destination("p").build(), Content::file(""));
    EXPECT_TRUE(result.isEmptyPath());
    EXPECT_FALSE(result.commandLine.has_value());
    EXPECT_TRUE(scratch->files.empty());
}

TEST_F(CommandBuilderTest, FilePathWithQuoteIsEscaped) {
    auto cmd = buildOk(JobOptions{}, Content::file("/tmp/bob's file.txt"));
    EXPECT_EQ("/tmp/bob's file.txt", splitShellWords(cmd).back());
}

TEST_F(CommandBuilderTest, InlineTextIsMaterializedInScratch) {
    types::Result result = builder->build(JobOptions{}, Content::text("hello\nworld"));
    ASSERT_TRUE(result.isSuccess()) << result.message;
    ASSERT_TRUE(result.scratchPath.has_value());

    EXPECT_EQ("hello\nworld", scratch->files.at(*result.scratchPath));
    EXPECT_EQ(result.scratchPath->string(), splitShellWords(*result.commandLine).back());
    EXPECT_TRUE(scratch->discarded.empty());
}

TEST_F(CommandBuilderTest, EachInlineJobGetsItsOwnScratchPath) {
    auto first = builder->build(JobOptions{}, Content::text("a"));
    auto second = builder->build(JobOptions{}, Content::text("b"));
    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_NE(first.scratchPath->string(), second.scratchPath->string());
}

TEST_F(CommandBuilderTest, ScratchPathFailureIsScratchIoError) {
    scratch->failNewPath = true;
    types::Result result = builder->build(JobOptions{}, Content::text("hello"));
    EXPECT_TRUE(result.isScratchIoError());
    EXPECT_FALSE(result.commandLine.has_value());
}

TEST_F(CommandBuilderTest, ScratchWriteFailureIsScratchIoError) {
    scratch->failWrite = true;
    types::Result result = builder->build(JobOptions{}, Content::text("hello"));
    EXPECT_TRUE(result.isScratchIoError());
    EXPECT_FALSE(result.commandLine.has_value());
    EXPECT_EQ(1u, scratch->discarded.size());
}

TEST_F(CommandBuilderTest, InlineTextWithoutStorageFails) {
    CommandBuilder noStorage(nullptr);
    EXPECT_TRUE(noStorage.build(JobOptions{}, Content::text("x")).isScratchIoError());
    EXPECT_TRUE(noStorage.build(JobOptions{}, Content::file("/a")).isSuccess());
}

TEST_F(CommandBuilderTest, SettingsControlScratchNaming) {
    CommandBuilder::Settings settings;
    settings.scratchPrefix = "receipt";
    settings.scratchExtension = "prn";
    CommandBuilder custom(scratch, settings);

    auto result = custom.build(JobOptions{}, Content::text("x"));
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(".prn", result.scratchPath->extension().string());
    EXPECT_EQ(0u, result.scratchPath->filename().string().rfind("receipt-", 0));
}

TEST(CommandBuilderDiskTest, InlineTextWrittenVerbatimToDisk) {
    auto dir = makeTempDir("builder");
    auto storage = std::make_shared<lpdispatch::storage::TempScratchStorage>(dir);
    CommandBuilder builder(storage);

    types::Result result = builder.build(JobOptions{}, Content::text("hello\nworld"));
    ASSERT_TRUE(result.isSuccess()) << result.message;

    std::filesystem::path written(splitShellWords(*result.commandLine).back());
    EXPECT_EQ(result.scratchPath->string(), written.string());
    EXPECT_EQ(dir.string(), written.parent_path().string());
    EXPECT_EQ("hello\nworld", readFile(written));

    std::filesystem::remove_all(dir);
}
