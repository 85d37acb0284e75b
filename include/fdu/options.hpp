#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fdu::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);
    OptionValue(std::vector<std::string> value);

    bool isNull() const noexcept;
    bool holds(OptionKind kind) const noexcept;

    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;
    std::vector<std::string> toStringList() const;

    bool operator==(const OptionValue &other) const noexcept { return value == other.value; }
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, std::string, std::vector<std::string>> value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
};

// Typed option store. Values set through set() or loaded from a JSON file
// are normalised to the kind of their definition; unknown keys are ignored.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const;
    std::vector<OptionDefinition> listRegisteredOptions() const;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);
    void resetToDefaults() noexcept;

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults(std::string *error = nullptr);
    bool saveDefaults() const;
    bool clearDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace fdu::config
