#pragma once

#include "command_line.hpp"
#include "fdu/options.hpp"

#include <filesystem>
#include <ostream>

namespace fdu::du
{

// Resolves the effective options (registry defaults plus command-line
// overrides), walks the tree and prints the report. Returns the process
// exit status.
int runDiskUsage(const CommandLine &commandLine, config::OptionRegistry &registry, std::ostream &out,
                 std::ostream &err);

// Same, with the working directory supplied by the caller.
int runDiskUsage(const CommandLine &commandLine, config::OptionRegistry &registry,
                 const std::filesystem::path &cwd, std::ostream &out, std::ostream &err);

} // namespace fdu::du
