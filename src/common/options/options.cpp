#include "fdu/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fdu::config
{
namespace
{
bool parseBool(const std::string &value, bool fallback)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return fallback;
}

std::int64_t parseInteger(const std::string &value, std::int64_t fallback)
{
    std::int64_t parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec == std::errc() && ptr == end && begin != end)
        return parsed;
    return fallback;
}

nlohmann::json toJson(const OptionDefinition &definition, const OptionValue &value)
{
    if (value.isNull())
        return nullptr;
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        return value.toString();
    case OptionKind::StringList:
        return value.toStringList();
    }
    return nullptr;
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(parseBool(jsonValue.get<std::string>(), definition.defaultValue.toBool()));
        break;
    case OptionKind::Integer:
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>());
        if (jsonValue.is_string())
            return OptionValue(parseInteger(jsonValue.get<std::string>(), definition.defaultValue.toInteger()));
        break;
    case OptionKind::String:
        if (jsonValue.is_string())
            return OptionValue(jsonValue.get<std::string>());
        if (jsonValue.is_number_integer())
            return OptionValue(std::to_string(jsonValue.get<std::int64_t>()));
        break;
    case OptionKind::StringList:
        if (jsonValue.is_array())
        {
            std::vector<std::string> result;
            for (const auto &item : jsonValue)
            {
                if (item.is_string())
                    result.push_back(item.get<std::string>());
            }
            return OptionValue(std::move(result));
        }
        if (jsonValue.is_string())
            return OptionValue(std::vector<std::string>{jsonValue.get<std::string>()});
        break;
    }
    return definition.defaultValue;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "fdu";
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "fdu";
    return std::filesystem::path(".config") / "fdu";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : value(std::move(value))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::holds(OptionKind kind) const noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return std::holds_alternative<bool>(value);
    case OptionKind::Integer:
        return std::holds_alternative<std::int64_t>(value);
    case OptionKind::String:
        return std::holds_alternative<std::string>(value);
    case OptionKind::StringList:
        return std::holds_alternative<std::vector<std::string>>(value);
    }
    return false;
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr, fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr, fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *lptr = std::get_if<std::vector<std::string>>(&value))
        return *lptr;
    if (auto *sptr = std::get_if<std::string>(&value))
    {
        if (sptr->empty())
            return {};
        return {*sptr};
    }
    return {};
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = normalizeValue(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(), [](const OptionDefinition &a, const OptionDefinition &b) {
        return a.key < b.key;
    });
    return result;
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *def = definition(key);
    if (!def)
        return;
    overrides[key] = normalizeValue(*def, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    if (const OptionDefinition *def = definition(key))
        return def->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    return get(key).toStringList();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath, std::string *error)
{
    std::ifstream in(filePath);
    if (!in)
    {
        if (error)
            *error = "cannot open '" + filePath.string() + "'";
        return false;
    }

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        if (error)
            *error = ex.what();
        return false;
    }

    if (!data.is_object())
    {
        if (error)
            *error = "expected a JSON object in '" + filePath.string() + "'";
        return false;
    }

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *def = definition(it.key());
        if (!def)
            continue;
        overrides[it.key()] = normalizeValue(*def, fromJson(*def, it.value()));
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, def] : definitions)
        data[key] = toJson(def, get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults(std::string *error)
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path, error);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

bool OptionRegistry::clearDefaults() const
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;
    return std::filesystem::remove(path, ec);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / (id + ".json");
}

std::filesystem::path OptionRegistry::configRoot()
{
    return detectConfigRoot();
}

OptionValue OptionRegistry::normalizeValue(const OptionDefinition &def, const OptionValue &value) const
{
    switch (def.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(def.defaultValue.toBool()));
    case OptionKind::Integer:
        return OptionValue(value.toInteger(def.defaultValue.toInteger()));
    case OptionKind::String:
        return OptionValue(value.toString(def.defaultValue.toString()));
    case OptionKind::StringList:
        return OptionValue(value.toStringList());
    }
    return value;
}

} // namespace fdu::config
