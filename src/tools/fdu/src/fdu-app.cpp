#include "command_line.hpp"
#include "disk_usage_options.hpp"
#include "disk_usage_run.hpp"

#include "fdu/options.hpp"

#include <iostream>
#include <string>
#include <vector>

#ifndef FDU_VERSION
#define FDU_VERSION "0.0.0"
#endif

using namespace fdu::du;

int main(int argc, char **argv)
{
    fdu::config::OptionRegistry registry("fdu");
    registerDiskUsageOptions(registry);

    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLineParseResult parsed = parseCommandLine(args);
    if (!parsed.ok())
    {
        std::cerr << "fdu: " << parsed.error << "\n"
                  << "Try 'fdu --help' for more information." << std::endl;
        return 1;
    }

    const CommandLine &commandLine = parsed.commandLine;
    if (commandLine.showHelp)
    {
        std::cout << usageText();
        return 0;
    }
    if (commandLine.showVersion)
    {
        std::cout << "fdu " << FDU_VERSION << std::endl;
        return 0;
    }

    if (commandLine.loadDefaults)
    {
        std::string error;
        if (!registry.loadDefaults(&error) && !error.empty())
            std::cerr << "fdu: ignoring saved defaults: " << error << std::endl;
    }
    for (const auto &file : commandLine.optionFiles)
    {
        std::string error;
        if (!registry.loadFromFile(file, &error))
        {
            std::cerr << "fdu: failed to load options from '" << file.string() << "': " << error << std::endl;
            return 1;
        }
    }

    return runDiskUsage(commandLine, registry, std::cout, std::cerr);
}
