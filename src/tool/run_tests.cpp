#include "run.hpp"
#include "uuid/hex.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace fastuuid;

namespace {

std::vector<std::string> split_lines(const std::string &s)
{
    std::vector<std::string> lines;
    std::istringstream in(s);
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);
    return lines;
}

} // namespace

class RunToolTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "fastuuid_run_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    // getopt() wants mutable argv
    int runTool(std::vector<std::string> args, std::ostream &out)
    {
        args.insert(args.begin(), "fastuuid");
        std::vector<char *> argv;
        for (auto &a: args)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        return tool::run_tool(static_cast<int>(args.size()), argv.data(), out);
    }

    std::string writeTestFile(const std::string &content)
    {
        const auto path = test_dir / "run.ini";
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(RunToolTest, DefaultsPrintOneIdentifier)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({}, out), EXIT_SUCCESS);

    const auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(uuid::valid_hex128(lines[0])) << lines[0];
}

TEST_F(RunToolTest, ThreadsTimesCountUniqueIdentifiers)
{
    std::ostringstream out;
    // more than one output chunk per worker
    EXPECT_EQ(runTool({"-n", "5000", "-t", "4"}, out), EXIT_SUCCESS);

    const auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 20000u);
    std::set<std::string> unique;
    for (const auto &line: lines) {
        EXPECT_TRUE(uuid::valid_hex128(line)) << line;
        unique.insert(line);
    }
    EXPECT_EQ(unique.size(), lines.size());
}

TEST_F(RunToolTest, RawFormatFlag)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({"-f", "raw", "-n", "3"}, out), EXIT_SUCCESS);

    const auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 3u);
    for (const auto &line: lines) {
        EXPECT_EQ(line.size(), 48u);
        EXPECT_EQ(line.find_first_not_of("0123456789abcdef"), std::string::npos);
    }
}

TEST_F(RunToolTest, QuietPrintsNothing)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({"-q", "-n", "10000", "-t", "2"}, out), EXIT_SUCCESS);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RunToolTest, FlagsOverrideConfigFile)
{
    auto path = writeTestFile("[generate]\ncount = 100\nformat = raw\n");

    std::ostringstream out;
    EXPECT_EQ(runTool({"-c", path, "-n", "2", "-f", "hex128"}, out), EXIT_SUCCESS);

    const auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(uuid::valid_hex128(lines[0]));
}

TEST_F(RunToolTest, ConfigFileValuesApply)
{
    auto path = writeTestFile("[generate]\ncount = 7\nthreads = 2\n");

    std::ostringstream out;
    EXPECT_EQ(runTool({"-c", path}, out), EXIT_SUCCESS);
    EXPECT_EQ(split_lines(out.str()).size(), 14u);
}

TEST_F(RunToolTest, InvalidFlagValueFails)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({"-t", "0"}, out), EXIT_FAILURE);
    EXPECT_EQ(runTool({"-n", "lots"}, out), EXIT_FAILURE);
    EXPECT_EQ(runTool({"-f", "base64"}, out), EXIT_FAILURE);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RunToolTest, BadConfigFileFails)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({"-c", (test_dir / "missing.ini").string()}, out), EXIT_FAILURE);

    auto path = writeTestFile("[generate]\nthreads = 5000\n");
    EXPECT_EQ(runTool({"-c", path}, out), EXIT_FAILURE);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RunToolTest, HelpAndUnknownFlagFail)
{
    std::ostringstream out;
    EXPECT_EQ(runTool({"-h"}, out), EXIT_FAILURE);
    EXPECT_EQ(runTool({"-x"}, out), EXIT_FAILURE);
}

TEST_F(RunToolTest, TotalBeyond64BitsIsRejected)
{
    // 3 * 9e18 does not fit in 64 bits; must fail before any work starts
    std::ostringstream out;
    EXPECT_EQ(runTool({"-q", "-n", "9000000000000000000", "-t", "3"}, out), EXIT_FAILURE);
}

TEST_F(RunToolTest, OptionsFromRejectsOverflowingTotal)
{
    cfg::cfg c;
    c.init();
    const auto g = c.section(cfg::GENERATE_SECTION);
    g->set("count", "9000000000000000000");
    g->set("threads", "3");
    EXPECT_THROW(tool::options_from(c), cfg::cfg_exception);

    g->set("threads", "2");
    const auto opts = tool::options_from(c);
    EXPECT_EQ(opts.count * opts.threads, 18000000000000000000ULL);
}

TEST_F(RunToolTest, WorkerExceptionReachesCaller)
{
    // an unopened file stream fails every write
    std::ofstream broken;
    broken.exceptions(std::ios::badbit | std::ios::failbit);

    auto gen = uuid::make_generator();
    tool::run_options opts;
    opts.count = 100;
    opts.threads = 4;
    EXPECT_THROW(tool::run(*gen, opts, broken), std::ios_base::failure);
}

TEST_F(RunToolTest, WorkerExceptionGivesFailureExitCode)
{
    std::ofstream broken;
    broken.exceptions(std::ios::badbit | std::ios::failbit);
    EXPECT_EQ(runTool({"-n", "10", "-t", "2"}, broken), EXIT_FAILURE);
}

TEST_F(RunToolTest, RunReportsTotal)
{
    std::vector<std::uint8_t> seed(24, 0x11);
    std::fill_n(seed.begin(), 8, 0);
    uuid::fixed_random_source source(seed);
    uuid::generator gen(source);

    tool::run_options opts;
    opts.count = 1000;
    opts.threads = 3;
    opts.print = false;

    std::ostringstream out;
    const auto result = tool::run(gen, opts, out);
    EXPECT_EQ(result.total, 3000u);
    EXPECT_GE(result.elapsed, 0.0);
    // one counter step per identifier
    EXPECT_EQ(gen.next()[0], (3001 & 0xff));
    EXPECT_EQ(gen.next128()[1], (3002 >> 8));
}
