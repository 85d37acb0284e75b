#include "disk_usage_run.hpp"

#include "fdu/du/exclusion.hpp"
#include "fdu/du/identity_set.hpp"
#include "fdu/du/output_sink.hpp"
#include "fdu/du/size_format.hpp"
#include "fdu/du/walker.hpp"

#include <optional>
#include <stdexcept>
#include <system_error>

namespace fdu::du
{
namespace
{
namespace fs = std::filesystem;

constexpr const char kProgram[] = "fdu";

} // namespace

int runDiskUsage(const CommandLine &commandLine, config::OptionRegistry &registry, std::ostream &out,
                 std::ostream &err)
{
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec)
    {
        err << kProgram << ": cannot determine the current directory: " << ec.message() << std::endl;
        return 1;
    }
    return runDiskUsage(commandLine, registry, cwd, out, err);
}

int runDiskUsage(const CommandLine &commandLine, config::OptionRegistry &registry, const fs::path &cwd,
                 std::ostream &out, std::ostream &err)
{
    DuOptions options = applyOverrides(optionsFromRegistry(registry), commandLine);

    std::optional<std::int64_t> thresholdBytes = parseSizeValue(options.threshold);
    if (!thresholdBytes)
    {
        err << kProgram << ": invalid threshold value '" << options.threshold << "'" << std::endl;
        return 1;
    }

    std::optional<SizeRenderer> renderer;
    try
    {
        renderer = SizeRenderer::select(options.humanReadable, options.blockSize);
    }
    catch (const std::invalid_argument &ex)
    {
        err << kProgram << ": " << ex.what() << " (got '" << options.blockSize << "')" << std::endl;
        return 1;
    }

    if (options.maxDepth < 0)
    {
        err << kProgram << ": invalid maximum depth '" << options.maxDepth << "'" << std::endl;
        return 1;
    }

    if (commandLine.saveDefaults)
    {
        storeOptions(registry, options);
        if (!registry.saveDefaults())
        {
            err << kProgram << ": failed to save defaults to '" << registry.defaultOptionsPath().string() << "'"
                << std::endl;
            return 1;
        }
    }

    fs::path root = cwd;
    if (commandLine.root)
        root = *commandLine.root;
    else if (commandLine.oneFileSystem)
        root = *commandLine.oneFileSystem;

    TraversalConfig config;
    config.maxDepth = options.maxDepth;
    config.sizeFormat = selectSizeFormat(options.apparentSize, options.humanReadable, !options.blockSize.empty());
    config.threshold = thresholdInUnits(config.sizeFormat, *thresholdBytes);
    config.summarize = commandLine.summarize;
    config.listFiles = commandLine.listFiles;
    config.countHardLinks = options.countHardLinks;
    config.symlinkPolicy = options.symlinkPolicy;
    config.reportErrors = options.reportErrors;

    if (options.stayOnFilesystem)
    {
        const fs::path &boundary = commandLine.oneFileSystem ? *commandLine.oneFileSystem : root;
        std::error_code ec;
        config.boundDevice = deviceOf(boundary.is_absolute() ? boundary : cwd / boundary, ec);
        if (!config.boundDevice)
        {
            err << kProgram << ": cannot access '" << boundary.string() << "': " << ec.message() << std::endl;
            return 1;
        }
    }

    if (!options.excludeFrom.empty())
    {
        fs::path exclusionFile(options.excludeFrom);
        if (exclusionFile.is_relative())
            exclusionFile = cwd / exclusionFile;
        auto entries = loadExclusionFile(exclusionFile, cwd);
        if (!entries)
        {
            err << kProgram << ": cannot read exclusion file '" << options.excludeFrom << "'" << std::endl;
            return 1;
        }
        config.exclusions = ExclusionSet::fromEntries(*entries);
    }
    for (const auto &pattern : options.excludePatterns)
        config.exclusions.addPattern(pattern);

    config.errorCallback = [&err](const std::string &path, const std::error_code &entryError) {
        err << kProgram << ": cannot access '" << path << "': " << entryError.message() << '\n';
    };
    if (commandLine.verbose)
    {
        config.skipCallback = [&err](const std::string &path, SkipReason reason) {
            err << kProgram << ": skipping '" << path << "': " << skipReasonName(reason) << '\n';
        };
    }

    IdentitySet identities;
    OutputSink sink(out, *renderer, config.reportPolicy());
    WalkResult result = walkDirectoryTree(root, cwd, config, identities, sink);
    if (!result.ok())
    {
        sink.flush();
        err << kProgram << ": cannot access '" << result.failedPath << "': " << result.error.message()
            << std::endl;
        return 1;
    }

    if (commandLine.summarize)
        sink.writeLine(result.totalSize, rootDisplayPath(root, cwd));
    else if (commandLine.total)
        sink.writeLine(result.totalSize, "total");
    sink.flush();
    return 0;
}

} // namespace fdu::du
