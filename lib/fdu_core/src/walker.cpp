#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "fdu/du/walker.hpp"

#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fdu::du
{
namespace
{
namespace fs = std::filesystem;

std::error_code lastError() noexcept
{
    return std::error_code(errno, std::generic_category());
}

std::string withoutTrailingSeparators(std::string path)
{
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    return path;
}

std::string absoluteNormal(const fs::path &path, const fs::path &cwd)
{
    fs::path absolute = path.is_absolute() ? path : cwd / path;
    return withoutTrailingSeparators(absolute.lexically_normal().string());
}

bool isDotEntry(const char *name) noexcept
{
    return name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0'));
}

// Owns one open directory stream and its descriptor.
class ScopedDirectory
{
public:
    ScopedDirectory() = default;
    explicit ScopedDirectory(DIR *stream) noexcept
        : dir(stream)
    {
    }
    ~ScopedDirectory()
    {
        if (dir)
            closedir(dir);
    }

    ScopedDirectory(ScopedDirectory &&other) noexcept
        : dir(other.dir)
    {
        other.dir = nullptr;
    }
    ScopedDirectory &operator=(ScopedDirectory &&) = delete;
    ScopedDirectory(const ScopedDirectory &) = delete;
    ScopedDirectory &operator=(const ScopedDirectory &) = delete;

    static ScopedDirectory openAt(int parentFd, const char *name, bool follow, std::error_code &ec)
    {
        int flags = O_RDONLY | O_DIRECTORY | O_CLOEXEC;
        if (!follow)
            flags |= O_NOFOLLOW;
        int fd = ::openat(parentFd, name, flags);
        if (fd < 0)
        {
            ec = lastError();
            return ScopedDirectory();
        }
        DIR *stream = ::fdopendir(fd);
        if (!stream)
        {
            ec = lastError();
            ::close(fd);
            return ScopedDirectory();
        }
        return ScopedDirectory(stream);
    }

    explicit operator bool() const noexcept { return dir != nullptr; }
    DIR *get() const noexcept { return dir; }
    int fd() const noexcept { return ::dirfd(dir); }

private:
    DIR *dir = nullptr;
};

class Walker
{
public:
    Walker(const TraversalConfig &config, IdentitySet &identities, OutputSink &sink,
           std::string displayRoot, std::string absoluteRoot)
        : config(config), identities(identities), sink(sink),
          displayPath(std::move(displayRoot)), absolutePath(std::move(absoluteRoot))
    {
    }

    std::int64_t scan(ScopedDirectory &directory, std::int64_t depth);

    const std::string &display() const noexcept { return displayPath.str(); }

    void reportError(const std::error_code &ec)
    {
        if (config.reportErrors && config.errorCallback)
            config.errorCallback(displayPath.str(), ec);
    }

    void reportSkip(SkipReason reason)
    {
        if (config.skipCallback)
            config.skipCallback(displayPath.str(), reason);
    }

private:
    std::int64_t visitDirectory(int parentFd, const char *name, const struct stat &sb, std::int64_t depth);
    std::int64_t visitLeaf(const struct stat &sb);

    const TraversalConfig &config;
    IdentitySet &identities;
    OutputSink &sink;
    PathAccumulator displayPath;
    PathAccumulator absolutePath;
};

std::int64_t Walker::scan(ScopedDirectory &directory, std::int64_t depth)
{
    const int fd = directory.fd();
    const int statFlags = config.followSymlinks() ? 0 : AT_SYMLINK_NOFOLLOW;
    std::int64_t total = 0;

    for (;;)
    {
        errno = 0;
        struct dirent *entry = ::readdir(directory.get());
        if (!entry)
        {
            if (errno != 0)
                reportError(lastError());
            break;
        }

        const char *name = entry->d_name;
        if (isDotEntry(name))
            continue;

        PathAccumulator::Frame displayFrame(displayPath, name);
        PathAccumulator::Frame absoluteFrame(absolutePath, name);

        struct stat sb{};
        if (::fstatat(fd, name, &sb, statFlags) != 0)
        {
            reportError(lastError());
            continue;
        }

        if (config.boundDevice && static_cast<std::uint64_t>(sb.st_dev) != *config.boundDevice)
        {
            reportSkip(SkipReason::OtherFilesystem);
            continue;
        }

        if (!config.exclusions.empty() && config.exclusions.isExcluded(absolutePath.view(), name))
        {
            reportSkip(SkipReason::Excluded);
            continue;
        }

        if (S_ISDIR(sb.st_mode))
            total += visitDirectory(fd, name, sb, depth);
        else
            total += visitLeaf(sb);
    }
    return total;
}

std::int64_t Walker::visitDirectory(int parentFd, const char *name, const struct stat &sb, std::int64_t depth)
{
    std::int64_t subtotal = dirSize(config.sizeFormat, statsFrom(sb));

    // Past the depth limit the directory node itself still counts.
    if (config.maxDepth > 0 && depth >= config.maxDepth)
        return subtotal;

    if (!identities.markVisited(static_cast<std::uint64_t>(sb.st_dev), static_cast<std::uint64_t>(sb.st_ino)))
    {
        reportSkip(SkipReason::AlreadyVisited);
        return 0;
    }

    std::error_code ec;
    ScopedDirectory child = ScopedDirectory::openAt(parentFd, name, config.followSymlinks(), ec);
    if (!child)
    {
        reportError(ec);
        return 0;
    }

    subtotal += scan(child, depth + 1);
    sink.reportDirectory(subtotal, displayPath.view());
    return subtotal;
}

std::int64_t Walker::visitLeaf(const struct stat &sb)
{
    if (!identities.shouldCount(static_cast<std::uint64_t>(sb.st_dev), static_cast<std::uint64_t>(sb.st_ino),
                                static_cast<std::uint64_t>(sb.st_nlink), config.countHardLinks))
        return 0;

    std::int64_t size = fileSize(config.sizeFormat, statsFrom(sb));
    sink.reportFile(size, displayPath.view());
    return size;
}

} // namespace

const char *skipReasonName(SkipReason reason) noexcept
{
    switch (reason)
    {
    case SkipReason::OtherFilesystem:
        return "on another file system";
    case SkipReason::Excluded:
        return "excluded";
    case SkipReason::AlreadyVisited:
        return "already visited";
    }
    return "";
}

PathAccumulator::PathAccumulator(std::string base)
    : buffer(std::move(base))
{
}

std::size_t PathAccumulator::push(std::string_view segment)
{
    std::size_t mark = buffer.size();
    if (!buffer.empty() && buffer.back() != '/')
        buffer.push_back('/');
    buffer.append(segment);
    return mark;
}

void PathAccumulator::truncate(std::size_t mark)
{
    if (mark < buffer.size())
        buffer.resize(mark);
}

std::string rootDisplayPath(const fs::path &root, const fs::path &cwd)
{
    if (absoluteNormal(root, cwd) == absoluteNormal(cwd, cwd))
        return ".";
    return withoutTrailingSeparators(root.string());
}

std::optional<std::uint64_t> deviceOf(const fs::path &path, std::error_code &ec)
{
    struct stat sb{};
    if (::stat(path.c_str(), &sb) != 0)
    {
        ec = lastError();
        return std::nullopt;
    }
    ec.clear();
    return static_cast<std::uint64_t>(sb.st_dev);
}

WalkResult walkDirectoryTree(const fs::path &root, const fs::path &cwd, const TraversalConfig &config,
                             IdentitySet &identities, OutputSink &sink)
{
    WalkResult result;
    const bool followRoot = config.followRootSymlink();
    const fs::path target = root.is_absolute() ? root : cwd / root;

    struct stat sb{};
    int rc = followRoot ? ::stat(target.c_str(), &sb) : ::lstat(target.c_str(), &sb);
    if (rc != 0)
    {
        result.error = lastError();
        result.failedPath = root.string();
        return result;
    }
    if (!S_ISDIR(sb.st_mode))
    {
        result.error = std::make_error_code(std::errc::not_a_directory);
        result.failedPath = root.string();
        return result;
    }

    int flags = O_RDONLY | O_DIRECTORY | O_CLOEXEC;
    if (!followRoot)
        flags |= O_NOFOLLOW;
    int fd = ::open(target.c_str(), flags);
    if (fd < 0)
    {
        result.error = lastError();
        result.failedPath = root.string();
        return result;
    }
    ScopedDirectory directory(::fdopendir(fd));
    if (!directory)
    {
        result.error = lastError();
        result.failedPath = root.string();
        ::close(fd);
        return result;
    }

    Walker walker(config, identities, sink, rootDisplayPath(root, cwd), absoluteNormal(root, cwd));

    if (config.boundDevice && static_cast<std::uint64_t>(sb.st_dev) != *config.boundDevice)
    {
        walker.reportSkip(SkipReason::OtherFilesystem);
        return result;
    }

    identities.markVisited(static_cast<std::uint64_t>(sb.st_dev), static_cast<std::uint64_t>(sb.st_ino));

    std::int64_t total = dirSize(config.sizeFormat, statsFrom(sb));
    total += walker.scan(directory, 0);
    sink.reportDirectory(total, walker.display());

    result.totalSize = total;
    return result;
}

} // namespace fdu::du
