#include <gtest/gtest.h>

#include "fdu/options.hpp"
#include "temp_tree.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace
{

struct EnvGuard
{
    explicit EnvGuard(const char *name)
        : key(name)
    {
        if (const char *value = std::getenv(name))
            previous = value;
    }
    ~EnvGuard()
    {
        if (previous)
            ::setenv(key.c_str(), previous->c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }

    std::string key;
    std::optional<std::string> previous;
};

void registerListOption(fdu::config::OptionRegistry &registry)
{
    registry.registerOption({"paths", fdu::config::OptionKind::StringList,
                             fdu::config::OptionValue(std::vector<std::string>{}), "List of paths"});
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    fdu::config::OptionRegistry registry("test-app");
    registry.registerOption(
        {"featureEnabled", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(true), "Enables a feature."});

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", fdu::config::OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));

    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    fdu::config::OptionRegistry registry("test-app");
    registry.registerOption({"maxDepth", fdu::config::OptionKind::Integer,
                             fdu::config::OptionValue(std::int64_t{10}), "Integer option"});
    registry.registerOption(
        {"enabled", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(false), "Boolean flag"});
    registry.registerOption(
        {"label", fdu::config::OptionKind::String, fdu::config::OptionValue("none"), "String option"});

    registry.set("maxDepth", fdu::config::OptionValue(std::string("42")));
    registry.set("enabled", fdu::config::OptionValue(std::string("yes")));
    registry.set("label", fdu::config::OptionValue(std::int64_t{7}));

    EXPECT_EQ(registry.getInteger("maxDepth"), 42);
    EXPECT_TRUE(registry.getBool("enabled"));
    EXPECT_EQ(registry.getString("label"), "7");
    EXPECT_TRUE(registry.get("label").holds(fdu::config::OptionKind::String));

    registry.set("maxDepth", fdu::config::OptionValue(std::string("not a number")));
    EXPECT_EQ(registry.getInteger("maxDepth"), 10);
}

TEST(OptionRegistry, IgnoresUnknownKeys)
{
    fdu::config::OptionRegistry registry("test-app");
    registry.set("unknown", fdu::config::OptionValue(true));
    EXPECT_TRUE(registry.get("unknown").isNull());
    EXPECT_EQ(registry.getString("unknown", "fallback"), "fallback");
}

TEST(OptionRegistry, ListsOptionsSortedByKey)
{
    fdu::config::OptionRegistry registry("test-app");
    registry.registerOption({"zeta", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(false), ""});
    registry.registerOption({"alpha", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(false), ""});
    registry.registerOption({"mid", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(false), ""});

    auto options = registry.listRegisteredOptions();
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].key, "alpha");
    EXPECT_EQ(options[1].key, "mid");
    EXPECT_EQ(options[2].key, "zeta");
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    fdu::test::TempTree tree("fdu_options_test_");
    fdu::config::OptionRegistry registry("test-app");
    registerListOption(registry);

    std::vector<std::string> expected{"/tmp/a", "/tmp/b"};
    registry.set("paths", fdu::config::OptionValue(expected));

    const auto filePath = tree.root() / "options.json";
    ASSERT_TRUE(registry.saveToFile(filePath));

    fdu::config::OptionRegistry loaded("test-app");
    registerListOption(loaded);
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getStringList("paths"), expected);
}

TEST(OptionRegistry, ReportsMalformedFiles)
{
    fdu::test::TempTree tree("fdu_options_test_");
    fdu::config::OptionRegistry registry("test-app");
    registerListOption(registry);

    auto broken = tree.writeText("broken.json", "{ \"paths\": [");
    std::string error;
    EXPECT_FALSE(registry.loadFromFile(broken, &error));
    EXPECT_FALSE(error.empty());

    auto notObject = tree.writeText("array.json", "[1, 2]");
    error.clear();
    EXPECT_FALSE(registry.loadFromFile(notObject, &error));
    EXPECT_NE(error.find("JSON object"), std::string::npos);

    error.clear();
    EXPECT_FALSE(registry.loadFromFile(tree.root() / "missing.json", &error));
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST(OptionRegistry, AcceptsLooseJsonTypes)
{
    fdu::test::TempTree tree("fdu_options_test_");
    fdu::config::OptionRegistry registry("test-app");
    registerListOption(registry);
    registry.registerOption(
        {"enabled", fdu::config::OptionKind::Boolean, fdu::config::OptionValue(false), "Boolean flag"});

    auto file = tree.writeText("loose.json", "{ \"paths\": \"/only\", \"enabled\": 1, \"other\": true }");
    ASSERT_TRUE(registry.loadFromFile(file));

    EXPECT_EQ(registry.getStringList("paths"), std::vector<std::string>{"/only"});
    EXPECT_TRUE(registry.getBool("enabled"));
}

TEST(OptionRegistry, StoresDefaultsUnderConfigRoot)
{
    EnvGuard guard("XDG_CONFIG_HOME");
    fdu::test::TempTree tree("fdu_options_test_");
    ::setenv("XDG_CONFIG_HOME", tree.root().c_str(), 1);

    EXPECT_EQ(fdu::config::OptionRegistry::configRoot(), tree.root() / "fdu");

    fdu::config::OptionRegistry registry("fdu");
    registerListOption(registry);
    EXPECT_EQ(registry.defaultOptionsPath(), tree.root() / "fdu" / "fdu.json");

    std::string error;
    EXPECT_FALSE(registry.loadDefaults(&error));
    EXPECT_TRUE(error.empty());

    registry.set("paths", fdu::config::OptionValue(std::vector<std::string>{"a"}));
    ASSERT_TRUE(registry.saveDefaults());
    EXPECT_TRUE(std::filesystem::exists(registry.defaultOptionsPath()));

    fdu::config::OptionRegistry reloaded("fdu");
    registerListOption(reloaded);
    ASSERT_TRUE(reloaded.loadDefaults());
    EXPECT_EQ(reloaded.getStringList("paths"), std::vector<std::string>{"a"});

    EXPECT_TRUE(reloaded.clearDefaults());
    EXPECT_FALSE(std::filesystem::exists(reloaded.defaultOptionsPath()));
}
