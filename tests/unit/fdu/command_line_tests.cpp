#include <gtest/gtest.h>

#include "command_line.hpp"
#include "disk_usage_options.hpp"

#include "fdu/options.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using fdu::du::CommandLineParseResult;
using fdu::du::SymlinkPolicy;

namespace
{

CommandLineParseResult parse(std::vector<std::string> args)
{
    return fdu::du::parseCommandLine(args);
}

} // namespace

TEST(CommandLine, DefaultsWithoutArguments)
{
    auto parsed = parse({});
    ASSERT_TRUE(parsed.ok());
    const auto &cl = parsed.commandLine;
    EXPECT_FALSE(cl.root.has_value());
    EXPECT_FALSE(cl.summarize);
    EXPECT_FALSE(cl.listFiles);
    EXPECT_TRUE(cl.loadDefaults);
    EXPECT_FALSE(cl.maxDepth.has_value());
}

TEST(CommandLine, ParsesBundledFlags)
{
    auto parsed = parse({"-ahlbscv", "data"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    const auto &cl = parsed.commandLine;
    EXPECT_TRUE(cl.listFiles);
    EXPECT_EQ(cl.humanReadable, true);
    EXPECT_EQ(cl.countHardLinks, true);
    EXPECT_EQ(cl.apparentSize, true);
    EXPECT_TRUE(cl.summarize);
    EXPECT_TRUE(cl.total);
    EXPECT_TRUE(cl.verbose);
    ASSERT_TRUE(cl.root.has_value());
    EXPECT_EQ(cl.root->string(), "data");
}

TEST(CommandLine, ReadsAttachedAndSeparateValues)
{
    auto parsed = parse({"-BM", "-d", "2", "-t10K", "-X", "list.txt"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    const auto &cl = parsed.commandLine;
    EXPECT_EQ(cl.blockSize, "M");
    EXPECT_EQ(cl.maxDepth, 2);
    EXPECT_EQ(cl.threshold, "10K");
    ASSERT_TRUE(cl.excludeFrom.has_value());
    EXPECT_EQ(cl.excludeFrom->string(), "list.txt");
}

TEST(CommandLine, ValueOptionEndsBundle)
{
    auto parsed = parse({"-sB", "1024", "-ax/mnt"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    const auto &cl = parsed.commandLine;
    EXPECT_TRUE(cl.summarize);
    EXPECT_EQ(cl.blockSize, "1024");
    EXPECT_TRUE(cl.listFiles);
    ASSERT_TRUE(cl.oneFileSystem.has_value());
    EXPECT_EQ(cl.oneFileSystem->string(), "/mnt");
    EXPECT_FALSE(cl.root.has_value());
}

TEST(CommandLine, ParsesLongOptions)
{
    auto parsed = parse({"--max-depth=3", "--block-size", "K", "--threshold=-1M", "--summarize",
                         "--no-default-options", "--load-options", "a.json", "--load-options=b.json"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    const auto &cl = parsed.commandLine;
    EXPECT_EQ(cl.maxDepth, 3);
    EXPECT_EQ(cl.blockSize, "K");
    EXPECT_EQ(cl.threshold, "-1M");
    EXPECT_TRUE(cl.summarize);
    EXPECT_FALSE(cl.loadDefaults);
    ASSERT_EQ(cl.optionFiles.size(), 2u);
    EXPECT_EQ(cl.optionFiles[1].string(), "b.json");
}

TEST(CommandLine, LastSymlinkPolicyWins)
{
    EXPECT_EQ(parse({"-H"}).commandLine.symlinkPolicy, SymlinkPolicy::CommandLineOnly);
    EXPECT_EQ(parse({"-L"}).commandLine.symlinkPolicy, SymlinkPolicy::Always);
    EXPECT_EQ(parse({"-LP"}).commandLine.symlinkPolicy, SymlinkPolicy::Never);
}

TEST(CommandLine, DoubleDashEndsOptions)
{
    auto parsed = parse({"-s", "--", "-a"});
    ASSERT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed.commandLine.listFiles);
    ASSERT_TRUE(parsed.commandLine.root.has_value());
    EXPECT_EQ(parsed.commandLine.root->string(), "-a");
}

TEST(CommandLine, ReportsErrors)
{
    EXPECT_EQ(parse({"-z"}).error, "unknown option '-z'");
    EXPECT_EQ(parse({"--bogus"}).error, "unknown option '--bogus'");
    EXPECT_EQ(parse({"-d"}).error, "-d requires a value");
    EXPECT_EQ(parse({"-dx"}).error, "invalid maximum depth 'x'");
    EXPECT_EQ(parse({"-d", "-1"}).error, "invalid maximum depth '-1'");
    EXPECT_EQ(parse({"--max-depth"}).error, "--max-depth requires a value");
    EXPECT_FALSE(parse({"-B"}).ok());
}

TEST(CommandLine, OverridesRegistryValues)
{
    fdu::config::OptionRegistry registry("fdu-test");
    fdu::du::registerDiskUsageOptions(registry);
    registry.set(fdu::du::kOptionHumanReadable, fdu::config::OptionValue(true));
    registry.set(fdu::du::kOptionMaxDepth, fdu::config::OptionValue(std::int64_t{4}));

    auto parsed = parse({"-d1", "-q", "-x", "/", "-L"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    auto options = fdu::du::applyOverrides(fdu::du::optionsFromRegistry(registry), parsed.commandLine);

    EXPECT_TRUE(options.humanReadable);
    EXPECT_EQ(options.maxDepth, 1);
    EXPECT_FALSE(options.reportErrors);
    EXPECT_TRUE(options.stayOnFilesystem);
    EXPECT_EQ(options.symlinkPolicy, SymlinkPolicy::Always);
    EXPECT_EQ(options.threshold, "0");
}

TEST(CommandLine, UsageMentionsEveryOption)
{
    std::string usage = fdu::du::usageText();
    EXPECT_NE(usage.find("Usage: fdu"), std::string::npos);
    for (const char *flag : {"-a", "-b", "-B", "-c", "-d", "-h", "-l", "-s", "-t", "-x", "-X", "-H", "-L", "-P"})
        EXPECT_NE(usage.find(flag), std::string::npos) << flag;
}

TEST(DiskUsageOptions, RegistersExpectedDefinitions)
{
    fdu::config::OptionRegistry registry("fdu-test");
    fdu::du::registerDiskUsageOptions(registry);

    auto options = registry.listRegisteredOptions();
    std::vector<std::string> keys;
    keys.reserve(options.size());
    for (const auto &definition : options)
        keys.push_back(definition.key);

    for (const char *key : {"symlinkPolicy", "countHardLinksMultiple", "threshold", "maxDepth", "blockSize",
                            "excludeFrom", "excludePatterns", "stayOnFilesystem"})
        EXPECT_NE(std::find(keys.begin(), keys.end(), key), keys.end()) << key;
}

TEST(DiskUsageOptions, RoundTripsThroughRegistry)
{
    fdu::config::OptionRegistry registry("fdu-test");
    fdu::du::registerDiskUsageOptions(registry);

    fdu::du::DuOptions options;
    options.symlinkPolicy = SymlinkPolicy::CommandLineOnly;
    options.countHardLinks = true;
    options.blockSize = "K";
    options.threshold = "1M";
    options.maxDepth = 2;
    options.excludePatterns = {"log", "tmp"};
    fdu::du::storeOptions(registry, options);

    auto loaded = fdu::du::optionsFromRegistry(registry);
    EXPECT_EQ(loaded.symlinkPolicy, SymlinkPolicy::CommandLineOnly);
    EXPECT_TRUE(loaded.countHardLinks);
    EXPECT_EQ(loaded.blockSize, "K");
    EXPECT_EQ(loaded.threshold, "1M");
    EXPECT_EQ(loaded.maxDepth, 2);
    EXPECT_EQ(loaded.excludePatterns, options.excludePatterns);
}

TEST(DiskUsageOptions, ConvertsSymlinkPolicyNames)
{
    EXPECT_EQ(fdu::du::policyFromString("always"), SymlinkPolicy::Always);
    EXPECT_EQ(fdu::du::policyFromString("command-line"), SymlinkPolicy::CommandLineOnly);
    EXPECT_EQ(fdu::du::policyFromString("unexpected"), SymlinkPolicy::Never);
    EXPECT_EQ(fdu::du::policyToString(SymlinkPolicy::CommandLineOnly), "command-line");
    EXPECT_EQ(fdu::du::policyToString(SymlinkPolicy::Never), "never");
}
