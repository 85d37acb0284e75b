#include "fdu/du/exclusion.hpp"

#include <cctype>
#include <fstream>
#include <system_error>

namespace fdu::du
{
namespace
{
namespace fs = std::filesystem;

std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

std::string withoutTrailingSeparators(std::string path)
{
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    return path;
}

} // namespace

std::optional<std::vector<ExclusionEntry>> loadExclusionFile(const fs::path &file, const fs::path &cwd)
{
    std::ifstream in(file);
    if (!in)
        return std::nullopt;

    std::vector<ExclusionEntry> entries;
    std::string line;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty())
            continue;

        fs::path candidate(trimmed);
        if (!candidate.is_absolute())
            candidate = cwd / candidate;
        candidate = candidate.lexically_normal();

        std::error_code ec;
        if (fs::is_directory(candidate, ec))
        {
            entries.push_back({ExclusionEntry::Kind::Path, withoutTrailingSeparators(candidate.string())});
            continue;
        }

        if (trimmed.size() > 2 && trimmed.compare(0, 2, "*.") == 0)
            entries.push_back({ExclusionEntry::Kind::Pattern, trimmed.substr(2)});
    }
    return entries;
}

std::string_view extensionOf(std::string_view name) noexcept
{
    std::size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0)
        return {};
    return name.substr(dot + 1);
}

ExclusionSet ExclusionSet::fromEntries(const std::vector<ExclusionEntry> &entries)
{
    ExclusionSet set;
    for (const auto &entry : entries)
        set.add(entry);
    return set;
}

void ExclusionSet::add(const ExclusionEntry &entry)
{
    if (entry.kind == ExclusionEntry::Kind::Path)
        addPath(entry.value);
    else
        addPattern(entry.value);
}

void ExclusionSet::addPath(std::string path)
{
    if (path.empty())
        return;
    paths.insert(withoutTrailingSeparators(std::move(path)));
}

void ExclusionSet::addPattern(std::string pattern)
{
    if (pattern.rfind("*.", 0) == 0)
        pattern.erase(0, 2);
    if (pattern.empty())
        return;
    patterns.insert(std::move(pattern));
}

bool ExclusionSet::isExcluded(std::string_view absolutePath, std::string_view name) const
{
    if (!paths.empty() && paths.find(std::string(absolutePath)) != paths.end())
        return true;
    if (patterns.empty())
        return false;
    std::string_view ext = extensionOf(name);
    if (ext.empty())
        return false;
    return patterns.find(std::string(ext)) != patterns.end();
}

} // namespace fdu::du
