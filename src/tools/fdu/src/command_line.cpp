#include "command_line.hpp"

#include <charconv>
#include <sstream>

namespace fdu::du
{
namespace
{
std::optional<std::int64_t> parseDepth(const std::string &value)
{
    std::int64_t depth = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, depth);
    if (begin == end || ec != std::errc() || ptr != end || depth < 0)
        return std::nullopt;
    return depth;
}

bool splitLongOption(const std::string &arg, const std::string &name, std::optional<std::string> &inlineValue)
{
    if (arg == name)
        return true;
    if (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 && arg[name.size()] == '=')
    {
        inlineValue = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

} // namespace

CommandLineParseResult parseCommandLine(const std::vector<std::string> &args)
{
    CommandLineParseResult result;
    CommandLine &cl = result.commandLine;
    bool optionsEnded = false;

    auto fail = [&](std::string message) {
        result.error = std::move(message);
        return result;
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-")
        {
            cl.root = std::filesystem::path(arg);
            continue;
        }

        if (arg == "--")
        {
            optionsEnded = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0)
        {
            std::optional<std::string> inlineValue;
            auto requireValue = [&](const std::string &name, std::string &value) {
                if (inlineValue)
                {
                    value = *inlineValue;
                    return true;
                }
                if (i + 1 >= args.size())
                {
                    result.error = name + " requires a value";
                    return false;
                }
                value = args[++i];
                return true;
            };

            std::string value;
            if (arg == "--help")
                cl.showHelp = true;
            else if (arg == "--version")
                cl.showVersion = true;
            else if (arg == "--human-readable")
                cl.humanReadable = true;
            else if (arg == "--all")
                cl.listFiles = true;
            else if (arg == "--count-links")
                cl.countHardLinks = true;
            else if (arg == "--bytes")
                cl.apparentSize = true;
            else if (arg == "--summarize")
                cl.summarize = true;
            else if (arg == "--total")
                cl.total = true;
            else if (arg == "--no-default-options")
                cl.loadDefaults = false;
            else if (arg == "--save-defaults")
                cl.saveDefaults = true;
            else if (splitLongOption(arg, "--max-depth", inlineValue))
            {
                if (!requireValue("--max-depth", value))
                    return result;
                auto depth = parseDepth(value);
                if (!depth)
                    return fail("invalid maximum depth '" + value + "'");
                cl.maxDepth = *depth;
            }
            else if (splitLongOption(arg, "--block-size", inlineValue))
            {
                if (!requireValue("--block-size", value))
                    return result;
                cl.blockSize = value;
            }
            else if (splitLongOption(arg, "--threshold", inlineValue))
            {
                if (!requireValue("--threshold", value))
                    return result;
                cl.threshold = value;
            }
            else if (splitLongOption(arg, "--one-file-system", inlineValue))
            {
                if (!requireValue("--one-file-system", value))
                    return result;
                cl.oneFileSystem = std::filesystem::path(value);
            }
            else if (splitLongOption(arg, "--exclude-from", inlineValue))
            {
                if (!requireValue("--exclude-from", value))
                    return result;
                cl.excludeFrom = std::filesystem::path(value);
            }
            else if (splitLongOption(arg, "--load-options", inlineValue))
            {
                if (!requireValue("--load-options", value))
                    return result;
                cl.optionFiles.emplace_back(value);
            }
            else
            {
                return fail("unknown option '" + arg + "'");
            }
            continue;
        }

        for (std::size_t j = 1; j < arg.size(); ++j)
        {
            char opt = arg[j];
            switch (opt)
            {
            case 'h':
                cl.humanReadable = true;
                break;
            case 'a':
                cl.listFiles = true;
                break;
            case 'l':
                cl.countHardLinks = true;
                break;
            case 'b':
                cl.apparentSize = true;
                break;
            case 's':
                cl.summarize = true;
                break;
            case 'c':
                cl.total = true;
                break;
            case 'H':
                cl.symlinkPolicy = SymlinkPolicy::CommandLineOnly;
                break;
            case 'L':
                cl.symlinkPolicy = SymlinkPolicy::Always;
                break;
            case 'P':
                cl.symlinkPolicy = SymlinkPolicy::Never;
                break;
            case 'q':
                cl.reportErrors = false;
                break;
            case 'v':
                cl.verbose = true;
                break;
            case 'B':
            case 'd':
            case 't':
            case 'x':
            case 'X':
            {
                std::string value;
                if (j + 1 < arg.size())
                {
                    value = arg.substr(j + 1);
                }
                else
                {
                    if (i + 1 >= args.size())
                        return fail(std::string("-") + opt + " requires a value");
                    value = args[++i];
                }
                j = arg.size();

                if (opt == 'B')
                {
                    cl.blockSize = value;
                }
                else if (opt == 'd')
                {
                    auto depth = parseDepth(value);
                    if (!depth)
                        return fail("invalid maximum depth '" + value + "'");
                    cl.maxDepth = *depth;
                }
                else if (opt == 't')
                {
                    cl.threshold = value;
                }
                else if (opt == 'x')
                {
                    cl.oneFileSystem = std::filesystem::path(value);
                }
                else
                {
                    cl.excludeFrom = std::filesystem::path(value);
                }
                break;
            }
            default:
                return fail(std::string("unknown option '-") + opt + "'");
            }
        }
    }

    return result;
}

DuOptions applyOverrides(DuOptions options, const CommandLine &cl)
{
    if (cl.symlinkPolicy)
        options.symlinkPolicy = *cl.symlinkPolicy;
    if (cl.countHardLinks)
        options.countHardLinks = *cl.countHardLinks;
    if (cl.reportErrors)
        options.reportErrors = *cl.reportErrors;
    if (cl.humanReadable)
        options.humanReadable = *cl.humanReadable;
    if (cl.apparentSize)
        options.apparentSize = *cl.apparentSize;
    if (cl.blockSize)
        options.blockSize = *cl.blockSize;
    if (cl.threshold)
        options.threshold = *cl.threshold;
    if (cl.maxDepth)
        options.maxDepth = *cl.maxDepth;
    if (cl.oneFileSystem)
        options.stayOnFilesystem = true;
    if (cl.excludeFrom)
        options.excludeFrom = cl.excludeFrom->string();
    return options;
}

std::string usageText()
{
    std::ostringstream out;
    out << "fdu - summarize disk usage of a directory tree\n\n"
        << "Usage: fdu [options] [path]\n"
        << "  -a, --all                  Also report individual files\n"
        << "  -b, --bytes                Count apparent sizes in bytes\n"
        << "  -B<unit|size>              Scale sizes by K, M, G, T, P, E, Z or a block size\n"
        << "      --block-size=SIZE      Same as -B\n"
        << "  -c, --total                Print a grand total line\n"
        << "  -d, --max-depth N          Do not descend more than N levels (0 = unlimited)\n"
        << "  -h, --human-readable       Print sizes such as 4.0K and 3.4M\n"
        << "  -l, --count-links          Count every hard link of a file\n"
        << "  -s, --summarize            Only print the total for the path\n"
        << "  -t, --threshold SIZE       Skip entries smaller than SIZE (or larger, if negative)\n"
        << "  -x, --one-file-system PATH Skip entries not on the file system of PATH\n"
        << "  -X, --exclude-from FILE    Exclude directories and *.ext patterns listed in FILE\n"
        << "  -H                         Follow a symbolic link given as path\n"
        << "  -L                         Follow all symbolic links\n"
        << "  -P                         Do not follow symbolic links (default)\n"
        << "  -q                         Do not report unreadable entries\n"
        << "  -v                         Report entries skipped by policy\n"
        << "      --load-options FILE    Load options from FILE\n"
        << "      --no-default-options   Do not load saved defaults\n"
        << "      --save-defaults        Save the effective options as defaults\n"
        << "      --help                 Show this help and exit\n"
        << "      --version              Show the version and exit\n";
    return out.str();
}

} // namespace fdu::du
