#include "fdu/du/size_model.hpp"

#include <sys/stat.h>

namespace fdu::du
{
namespace
{
constexpr std::int64_t kStatBlockSize = 512;

std::int64_t allocatedBytes(const FileStats &stats) noexcept
{
    if (stats.blocks < 0)
        return 0;
    return stats.blocks * kStatBlockSize;
}

} // namespace

FileStats statsFrom(const struct stat &sb) noexcept
{
    FileStats stats;
    stats.size = static_cast<std::int64_t>(sb.st_size);
    stats.blocks = static_cast<std::int64_t>(sb.st_blocks);
    return stats;
}

std::int64_t dirSize(SizeFormat format, const FileStats &stats) noexcept
{
    switch (format)
    {
    case SizeFormat::Bytes:
        return 0;
    case SizeFormat::HumanReadableDiskUsage:
        return allocatedBytes(stats);
    case SizeFormat::BlockDiskUsage:
        return allocatedBytes(stats) / 1024;
    }
    return 0;
}

std::int64_t fileSize(SizeFormat format, const FileStats &stats) noexcept
{
    switch (format)
    {
    case SizeFormat::Bytes:
        return stats.size < 0 ? 0 : stats.size;
    case SizeFormat::HumanReadableDiskUsage:
        return allocatedBytes(stats);
    case SizeFormat::BlockDiskUsage:
        return allocatedBytes(stats) / 1024;
    }
    return 0;
}

SizeFormat selectSizeFormat(bool apparentBytes, bool humanReadable, bool blockSizeSet) noexcept
{
    // -B scales disk usage even when -b is also given.
    if (blockSizeSet)
        return SizeFormat::HumanReadableDiskUsage;
    if (apparentBytes)
        return SizeFormat::Bytes;
    if (humanReadable)
        return SizeFormat::HumanReadableDiskUsage;
    return SizeFormat::BlockDiskUsage;
}

std::int64_t thresholdInUnits(SizeFormat format, std::int64_t thresholdBytes) noexcept
{
    if (format == SizeFormat::BlockDiskUsage)
        return thresholdBytes / 1024;
    return thresholdBytes;
}

} // namespace fdu::du
