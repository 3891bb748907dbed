//! # Doc Command Tests
//!
//! Argument parsing and end-to-end runs of the doc command against a
//! temporary contracts tree.

#include "cli/cmd_doc.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace vydoc;
using namespace vydoc::cli;
namespace fs = std::filesystem;

namespace {

auto parse(std::vector<const char*> args) -> Result<DocOptions, std::string> {
    args.insert(args.begin(), "vydoc");
    return parse_doc_args(static_cast<int>(args.size()), args.data());
}

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(ParseDocArgsTest, Defaults) {
    auto result = parse({"contracts"});
    ASSERT_TRUE(is_ok(result));
    const auto& options = unwrap(result);
    EXPECT_EQ(options.contracts_dir, "contracts");
    EXPECT_EQ(options.output_dir, ".");
    EXPECT_EQ(options.format, DocFormat::Rst);
    EXPECT_EQ(options.jobs, 1u);
    EXPECT_TRUE(options.build);
    EXPECT_FALSE(options.show_help);
}

TEST(ParseDocArgsTest, OutputForms) {
    EXPECT_EQ(unwrap(parse({"contracts", "-o", "site"})).output_dir, "site");
    EXPECT_EQ(unwrap(parse({"contracts", "--output", "site"})).output_dir, "site");
    EXPECT_EQ(unwrap(parse({"contracts", "--output=site"})).output_dir, "site");
    EXPECT_EQ(unwrap(parse({"-o=site", "contracts"})).output_dir, "site");
}

TEST(ParseDocArgsTest, FormatAndBuild) {
    auto result = parse({"contracts", "--format=json", "--no-build"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).format, DocFormat::Json);
    EXPECT_FALSE(unwrap(result).build);

    auto bad = parse({"contracts", "--format=html"});
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad), "unknown format 'html' (expected rst or json)");
}

TEST(ParseDocArgsTest, Jobs) {
    EXPECT_EQ(unwrap(parse({"contracts", "-j", "4"})).jobs, 4u);
    EXPECT_EQ(unwrap(parse({"contracts", "--jobs=0"})).jobs, 0u);

    auto bad = parse({"contracts", "--jobs=many"});
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad), "invalid job count 'many'");
    EXPECT_TRUE(is_err(parse({"contracts", "-j"})));
}

TEST(ParseDocArgsTest, UsageErrors) {
    auto missing = parse({});
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing), "missing contracts directory");

    auto extra = parse({"contracts", "more"});
    ASSERT_TRUE(is_err(extra));
    EXPECT_EQ(unwrap_err(extra), "unexpected argument 'more'");

    auto unknown = parse({"contracts", "--fast"});
    ASSERT_TRUE(is_err(unknown));
    EXPECT_EQ(unwrap_err(unknown), "unknown option '--fast'");

    EXPECT_TRUE(is_err(parse({"contracts", "-o"})));
}

TEST(ParseDocArgsTest, HelpNeedsNoDirectory) {
    auto result = parse({"--help"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).show_help);
    EXPECT_TRUE(unwrap(parse({"-h"})).show_help);
}

TEST(ParseDocArgsTest, LogOptionsAreSkipped) {
    auto result = parse({"-vv", "contracts", "--log-filter=extract=debug", "-q"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).contracts_dir, "contracts");
}

// ============================================================================
// Running
// ============================================================================

class RunDocTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string("vydoc_cmd_doc_") + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "contracts");

        std::ofstream out(root_ / "contracts" / "token.vy");
        out << "\"\"\"Token.\"\"\"\n"
               "owner: public(address)\n"
               "\n"
               "@external\n"
               "def transfer(to: address, amount: uint256) -> bool:\n"
               "    \"\"\"Transfer tokens.\"\"\"\n"
               "    return True\n";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    auto options() -> DocOptions {
        DocOptions opts;
        opts.contracts_dir = (root_ / "contracts").string();
        opts.output_dir = (root_ / "out").string();
        opts.build = false;
        return opts;
    }
};

TEST_F(RunDocTest, WritesRstSources) {
    EXPECT_EQ(run_doc(options()), exit_codes::SUCCESS);

    auto docs = root_ / "out" / "docs";
    EXPECT_TRUE(fs::exists(docs / "conf.py"));
    EXPECT_NE(read_file(docs / "index.rst").find("   token\n"), std::string::npos);

    auto page = read_file(docs / "token.rst");
    EXPECT_NE(page.find(".. py:attribute:: owner\n\n   public(address)"), std::string::npos);
    EXPECT_NE(page.find(".. py:function:: transfer(to: address, amount: uint256) -> bool"),
              std::string::npos);
}

TEST_F(RunDocTest, WritesJson) {
    auto opts = options();
    opts.format = DocFormat::Json;
    EXPECT_EQ(run_doc(opts), exit_codes::SUCCESS);

    auto json = read_file(root_ / "out" / "docs" / "contracts.json");
    EXPECT_NE(json.find("\"name\": \"transfer\""), std::string::npos);
    EXPECT_FALSE(fs::exists(root_ / "out" / "docs" / "conf.py"));
}

TEST_F(RunDocTest, InvalidSourceDirectory) {
    auto opts = options();
    opts.contracts_dir = (root_ / "missing").string();
    EXPECT_EQ(run_doc(opts), exit_codes::FAILURE);
    EXPECT_FALSE(fs::exists(root_ / "out"));
}

TEST_F(RunDocTest, BuilderStatusDecidesExitCode) {
    auto opts = options();
    opts.build = true;

    opts.sphinx_build = "true";
    EXPECT_EQ(run_doc(opts), exit_codes::SUCCESS);

    opts.sphinx_build = "false";
    EXPECT_EQ(run_doc(opts), exit_codes::FAILURE);
}
