#pragma once

#include "fdu/du/walker.hpp"
#include "fdu/options.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fdu::du
{

inline constexpr const char kOptionSymlinkPolicy[] = "symlinkPolicy";
inline constexpr const char kOptionHardLinks[] = "countHardLinksMultiple";
inline constexpr const char kOptionReportErrors[] = "reportErrors";
inline constexpr const char kOptionHumanReadable[] = "humanReadable";
inline constexpr const char kOptionApparentSize[] = "apparentSize";
inline constexpr const char kOptionBlockSize[] = "blockSize";
inline constexpr const char kOptionThreshold[] = "threshold";
inline constexpr const char kOptionMaxDepth[] = "maxDepth";
inline constexpr const char kOptionStayOnFilesystem[] = "stayOnFilesystem";
inline constexpr const char kOptionExcludeFrom[] = "excludeFrom";
inline constexpr const char kOptionExcludePatterns[] = "excludePatterns";

// Settings that can be persisted as defaults. Per-run switches such as
// -a, -s and -c are not part of it.
struct DuOptions
{
    SymlinkPolicy symlinkPolicy = SymlinkPolicy::Never;
    bool countHardLinks = false;
    bool reportErrors = true;
    bool humanReadable = false;
    bool apparentSize = false;
    std::string blockSize;
    std::string threshold = "0";
    std::int64_t maxDepth = 0;
    bool stayOnFilesystem = false;
    std::string excludeFrom;
    std::vector<std::string> excludePatterns;
};

void registerDiskUsageOptions(config::OptionRegistry &registry);
DuOptions optionsFromRegistry(const config::OptionRegistry &registry);
void storeOptions(config::OptionRegistry &registry, const DuOptions &options);

SymlinkPolicy policyFromString(const std::string &value);
std::string policyToString(SymlinkPolicy policy);

} // namespace fdu::du
