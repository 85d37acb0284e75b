#pragma once

#include "fdu/du/exclusion.hpp"
#include "fdu/du/identity_set.hpp"
#include "fdu/du/output_sink.hpp"
#include "fdu/du/size_model.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace fdu::du
{

enum class SymlinkPolicy
{
    Never,
    CommandLineOnly,
    Always
};

enum class SkipReason
{
    OtherFilesystem,
    Excluded,
    AlreadyVisited
};

const char *skipReasonName(SkipReason reason) noexcept;

struct TraversalConfig
{
    std::int64_t maxDepth = 0; // 0 = unbounded
    std::optional<std::uint64_t> boundDevice;
    ExclusionSet exclusions;
    SizeFormat sizeFormat = SizeFormat::BlockDiskUsage;
    std::int64_t threshold = 0; // in sizeFormat units
    bool summarize = false;
    bool listFiles = false;
    bool countHardLinks = false;
    SymlinkPolicy symlinkPolicy = SymlinkPolicy::Never;
    bool reportErrors = true;
    std::function<void(const std::string &, const std::error_code &)> errorCallback;
    std::function<void(const std::string &, SkipReason)> skipCallback;

    bool followSymlinks() const noexcept { return symlinkPolicy == SymlinkPolicy::Always; }
    bool followRootSymlink() const noexcept { return symlinkPolicy != SymlinkPolicy::Never; }
    ReportPolicy reportPolicy() const noexcept { return ReportPolicy{threshold, summarize, listFiles}; }
};

// The current relative path as one growing buffer. Segments are appended
// on descent and cut off again on return.
class PathAccumulator
{
public:
    class Frame
    {
    public:
        Frame(PathAccumulator &accumulator, std::string_view segment)
            : owner(accumulator), mark(accumulator.push(segment))
        {
        }
        ~Frame() { owner.truncate(mark); }

        Frame(const Frame &) = delete;
        Frame &operator=(const Frame &) = delete;

    private:
        PathAccumulator &owner;
        std::size_t mark;
    };

    PathAccumulator() = default;
    explicit PathAccumulator(std::string base);

    std::size_t push(std::string_view segment);
    void truncate(std::size_t mark);

    std::string_view view() const noexcept { return buffer; }
    const std::string &str() const noexcept { return buffer; }

private:
    std::string buffer;
};

struct WalkResult
{
    std::int64_t totalSize = 0;
    std::error_code error;
    std::string failedPath;

    bool ok() const noexcept { return !error; }
};

// "." when root is the working directory, otherwise root as given without
// trailing separators.
std::string rootDisplayPath(const std::filesystem::path &root, const std::filesystem::path &cwd);

std::optional<std::uint64_t> deviceOf(const std::filesystem::path &path, std::error_code &ec);

// Post-order, fd-relative walk of root. Directory lines (and file lines
// when listing files) go to sink as each subtree completes; the root's
// line is written last. A relative root is resolved against cwd. Only
// root-level failures are returned as errors.
WalkResult walkDirectoryTree(const std::filesystem::path &root, const std::filesystem::path &cwd,
                             const TraversalConfig &config, IdentitySet &identities, OutputSink &sink);

} // namespace fdu::du
