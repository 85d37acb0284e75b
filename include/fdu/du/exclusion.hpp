#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fdu::du
{

struct ExclusionEntry
{
    enum class Kind
    {
        Path,   // absolute directory path
        Pattern // file extension without the leading "*."
    };

    Kind kind = Kind::Pattern;
    std::string value;

    bool operator==(const ExclusionEntry &) const noexcept = default;
};

// Reads an exclusion list: one entry per line. Lines naming an existing
// directory (absolute or relative to cwd) become Path entries, "*.ext"
// lines become Pattern entries, everything else is ignored.
std::optional<std::vector<ExclusionEntry>> loadExclusionFile(const std::filesystem::path &file,
                                                             const std::filesystem::path &cwd);

// Text after the last '.' of a file name; empty when there is none or the
// only dot is the leading one of a dotfile.
std::string_view extensionOf(std::string_view name) noexcept;

class ExclusionSet
{
public:
    static ExclusionSet fromEntries(const std::vector<ExclusionEntry> &entries);

    void add(const ExclusionEntry &entry);
    void addPath(std::string path);
    void addPattern(std::string pattern);

    bool empty() const noexcept { return paths.empty() && patterns.empty(); }

    bool isExcluded(std::string_view absolutePath, std::string_view name) const;

private:
    std::unordered_set<std::string> paths;
    std::unordered_set<std::string> patterns;
};

} // namespace fdu::du
