#pragma once

#include "disk_usage_options.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fdu::du
{

struct CommandLine
{
    bool showHelp = false;
    bool showVersion = false;

    std::optional<std::filesystem::path> root;
    bool listFiles = false;
    bool summarize = false;
    bool total = false;
    bool verbose = false;

    std::optional<SymlinkPolicy> symlinkPolicy;
    std::optional<bool> countHardLinks;
    std::optional<bool> reportErrors;
    std::optional<bool> humanReadable;
    std::optional<bool> apparentSize;
    std::optional<std::string> blockSize;
    std::optional<std::string> threshold;
    std::optional<std::int64_t> maxDepth;
    std::optional<std::filesystem::path> oneFileSystem;
    std::optional<std::filesystem::path> excludeFrom;

    bool loadDefaults = true;
    bool saveDefaults = false;
    std::vector<std::filesystem::path> optionFiles;
};

struct CommandLineParseResult
{
    CommandLine commandLine;
    std::string error;

    bool ok() const noexcept { return error.empty(); }
};

// args excludes the program name.
CommandLineParseResult parseCommandLine(const std::vector<std::string> &args);

DuOptions applyOverrides(DuOptions options, const CommandLine &commandLine);

std::string usageText();

} // namespace fdu::du
