#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

#include "utils/cli.h"
#include "utils/version.h"
#include "test_support.h"

using namespace airdl;
using airdl::test::TempDir;

namespace {

CliResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "airdl");
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parseCliArgs(static_cast<int>(args.size()), argv.data());
}

}  // namespace

// Test --help flag
TEST(CliTest, HelpFlagShowsHelpMessage) {
    CliResult result = parse({"--help"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.output.find("airdl") != std::string::npos);
    EXPECT_TRUE(result.output.find("--local-dir") != std::string::npos);
    EXPECT_TRUE(result.output.find("--force-unsafe") != std::string::npos);
}

TEST(CliTest, HelpWinsOverOtherErrors) {
    CliResult result = parse({"--bogus", "-h"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
}

// Test --version flag
TEST(CliTest, VersionFlagShowsVersion) {
    for (const char* flag : {"--version", "-V"}) {
        CliResult result = parse({flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_EQ(result.output, std::string("airdl ") + AIRDL_VERSION + "\n");
    }
}

TEST(CliTest, NoArgumentsIsUsageError) {
    CliResult result = parse({});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.output.find("Usage:") != std::string::npos);
}

TEST(CliTest, ParsesAirReferencesAndFilters) {
    CliResult result = parse({"--air", "urn:air:sdxl:checkpoint:civitai:1@2", "urn:air:flux1:lora:civitai:3@4.safetensor",
                              "-l", "/models", "--size", "pruned", "--fp", "16", "--include-companions",
                              "--force-unsafe", "--debug", "--token", "abc"});

    ASSERT_FALSE(result.should_exit) << result.output;
    const auto& opts = result.options;
    EXPECT_EQ(opts.mode, ReferenceMode::Air);
    EXPECT_EQ(opts.references.size(), 2u);
    EXPECT_EQ(opts.local_dir, "/models");
    EXPECT_EQ(opts.size.value_or(""), "pruned");
    EXPECT_EQ(opts.fp.value_or(0), 16);
    EXPECT_TRUE(opts.include_companions);
    EXPECT_TRUE(opts.force_unsafe);
    EXPECT_TRUE(opts.debug);
    EXPECT_EQ(opts.token.value_or(""), "abc");
    EXPECT_EQ(referenceModeToString(opts.mode), "air");
}

TEST(CliTest, RepeatedUrlFlagAccumulates) {
    CliResult result = parse({"-u", "https://civitai.com/api/download/models/1", "--local-dir", "out", "--url",
                              "https://civitai.com/api/download/models/2"});
    ASSERT_FALSE(result.should_exit) << result.output;
    EXPECT_EQ(result.options.mode, ReferenceMode::Url);
    EXPECT_EQ(result.options.references,
              (std::vector<std::string>{"https://civitai.com/api/download/models/1",
                                        "https://civitai.com/api/download/models/2"}));
    EXPECT_FALSE(result.options.size.has_value());
    EXPECT_FALSE(result.options.fp.has_value());
}

TEST(CliTest, UrlAndAirAreMutuallyExclusive) {
    CliResult result = parse({"--url", "https://civitai.com/api/download/models/1", "--air",
                              "urn:air:sdxl:checkpoint:civitai:1@2", "-l", "out"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.output.find("cannot be used together") != std::string::npos);
}

TEST(CliTest, RequiresModeAndLocalDir) {
    CliResult no_mode = parse({"--local-dir", "out"});
    EXPECT_EQ(no_mode.exit_code, 1);
    EXPECT_TRUE(no_mode.output.find("--url or --air") != std::string::npos);

    CliResult no_dir = parse({"--air", "urn:air:sdxl:checkpoint:civitai:1@2"});
    EXPECT_EQ(no_dir.exit_code, 1);
    EXPECT_TRUE(no_dir.output.find("--local-dir is required") != std::string::npos);

    CliResult no_values = parse({"--air", "--local-dir", "out"});
    EXPECT_EQ(no_values.exit_code, 1);
    EXPECT_TRUE(no_values.output.find("expects at least one value") != std::string::npos);
}

TEST(CliTest, RejectsOutOfRangeFilters) {
    CliResult bad_size = parse({"--air", "a:b:civitai:1", "-l", "out", "--size", "half"});
    EXPECT_EQ(bad_size.exit_code, 1);
    EXPECT_TRUE(bad_size.output.find("invalid --size 'half'") != std::string::npos);

    CliResult bad_fp = parse({"--air", "a:b:civitai:1", "-l", "out", "--fp", "bf16"});
    EXPECT_EQ(bad_fp.exit_code, 1);
    EXPECT_TRUE(bad_fp.output.find("invalid --fp 'bf16'") != std::string::npos);

    CliResult unknown = parse({"--air", "a:b:civitai:1", "-l", "out", "--parallel"});
    EXPECT_EQ(unknown.exit_code, 1);
    EXPECT_TRUE(unknown.output.find("unrecognized argument '--parallel'") != std::string::npos);
}

TEST(CliTest, UrlListFilesAreExpanded) {
    TempDir temp;
    const auto list = temp.path / "urls.txt";
    std::ofstream(list) << "# nightly\n"
                        << "https://civitai.com/api/download/models/10\n"
                        << "\n"
                        << "  https://civitai.com/api/download/models/11?type=Model  \n";

    CliResult result = parse({"--url", list.string(), "https://civitai.com/api/download/models/12", "-l", "out"});
    ASSERT_FALSE(result.should_exit) << result.output;
    EXPECT_EQ(result.options.references,
              (std::vector<std::string>{"https://civitai.com/api/download/models/10",
                                        "https://civitai.com/api/download/models/11?type=Model",
                                        "https://civitai.com/api/download/models/12"}));
}

TEST(CliTest, EmptyUrlListIsUsageError) {
    TempDir temp;
    const auto list = temp.path / "empty.txt";
    std::ofstream(list) << "# nothing yet\n";

    CliResult result = parse({"--url", list.string(), "-l", "out"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.output.find("no URLs given") != std::string::npos);
}
