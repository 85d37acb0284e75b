#include "disk_usage_options.hpp"

namespace fdu::du
{

void registerDiskUsageOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionSymlinkPolicy, config::OptionKind::String, config::OptionValue("never"),
                             "Symbolic link policy: never, command-line or always."});
    registry.registerOption({kOptionHardLinks, config::OptionKind::Boolean, config::OptionValue(false),
                             "Count every hard link of a file instead of the first one only."});
    registry.registerOption({kOptionReportErrors, config::OptionKind::Boolean, config::OptionValue(true),
                             "Print a diagnostic for entries that cannot be read."});
    registry.registerOption({kOptionHumanReadable, config::OptionKind::Boolean, config::OptionValue(false),
                             "Print sizes with K, M, G, ... suffixes."});
    registry.registerOption({kOptionApparentSize, config::OptionKind::Boolean, config::OptionValue(false),
                             "Account apparent sizes in bytes instead of disk usage."});
    registry.registerOption({kOptionBlockSize, config::OptionKind::String, config::OptionValue(""),
                             "Scale sizes by a unit letter or a block size in bytes."});
    registry.registerOption({kOptionThreshold, config::OptionKind::String, config::OptionValue("0"),
                             "Only report entries whose size meets the threshold."});
    registry.registerOption({kOptionMaxDepth, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(0)),
                             "Do not descend below this depth; 0 means unlimited."});
    registry.registerOption({kOptionStayOnFilesystem, config::OptionKind::Boolean, config::OptionValue(false),
                             "Skip entries on a different file system than the root."});
    registry.registerOption({kOptionExcludeFrom, config::OptionKind::String, config::OptionValue(""),
                             "File listing directories and *.ext patterns to exclude."});
    registry.registerOption({kOptionExcludePatterns, config::OptionKind::StringList,
                             config::OptionValue(std::vector<std::string>{}),
                             "File extensions that are always excluded."});
}

DuOptions optionsFromRegistry(const config::OptionRegistry &registry)
{
    DuOptions opts;
    opts.symlinkPolicy = policyFromString(registry.getString(kOptionSymlinkPolicy, "never"));
    opts.countHardLinks = registry.getBool(kOptionHardLinks, false);
    opts.reportErrors = registry.getBool(kOptionReportErrors, true);
    opts.humanReadable = registry.getBool(kOptionHumanReadable, false);
    opts.apparentSize = registry.getBool(kOptionApparentSize, false);
    opts.blockSize = registry.getString(kOptionBlockSize);
    opts.threshold = registry.getString(kOptionThreshold, "0");
    opts.maxDepth = registry.getInteger(kOptionMaxDepth, 0);
    opts.stayOnFilesystem = registry.getBool(kOptionStayOnFilesystem, false);
    opts.excludeFrom = registry.getString(kOptionExcludeFrom);
    opts.excludePatterns = registry.getStringList(kOptionExcludePatterns);
    return opts;
}

void storeOptions(config::OptionRegistry &registry, const DuOptions &options)
{
    registry.set(kOptionSymlinkPolicy, config::OptionValue(policyToString(options.symlinkPolicy)));
    registry.set(kOptionHardLinks, config::OptionValue(options.countHardLinks));
    registry.set(kOptionReportErrors, config::OptionValue(options.reportErrors));
    registry.set(kOptionHumanReadable, config::OptionValue(options.humanReadable));
    registry.set(kOptionApparentSize, config::OptionValue(options.apparentSize));
    registry.set(kOptionBlockSize, config::OptionValue(options.blockSize));
    registry.set(kOptionThreshold, config::OptionValue(options.threshold));
    registry.set(kOptionMaxDepth, config::OptionValue(options.maxDepth));
    registry.set(kOptionStayOnFilesystem, config::OptionValue(options.stayOnFilesystem));
    registry.set(kOptionExcludeFrom, config::OptionValue(options.excludeFrom));
    registry.set(kOptionExcludePatterns, config::OptionValue(options.excludePatterns));
}

SymlinkPolicy policyFromString(const std::string &value)
{
    if (value == "always")
        return SymlinkPolicy::Always;
    if (value == "command-line")
        return SymlinkPolicy::CommandLineOnly;
    return SymlinkPolicy::Never;
}

std::string policyToString(SymlinkPolicy policy)
{
    switch (policy)
    {
    case SymlinkPolicy::Always:
        return "always";
    case SymlinkPolicy::CommandLineOnly:
        return "command-line";
    case SymlinkPolicy::Never:
    default:
        return "never";
    }
}

} // namespace fdu::du
