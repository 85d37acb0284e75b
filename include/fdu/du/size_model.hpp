#pragma once

#include <cstdint>

struct stat;

namespace fdu::du
{

struct FileStats
{
    std::int64_t size = 0;
    std::int64_t blocks = 0;
};

// Accounting unit, chosen once per run.
enum class SizeFormat
{
    Bytes,                  // apparent size; directories contribute nothing
    HumanReadableDiskUsage, // allocated bytes
    BlockDiskUsage          // allocated 1K units
};

FileStats statsFrom(const struct stat &sb) noexcept;

std::int64_t dirSize(SizeFormat format, const FileStats &stats) noexcept;
std::int64_t fileSize(SizeFormat format, const FileStats &stats) noexcept;

SizeFormat selectSizeFormat(bool apparentBytes, bool humanReadable, bool blockSizeSet) noexcept;
std::int64_t thresholdInUnits(SizeFormat format, std::int64_t thresholdBytes) noexcept;

} // namespace fdu::du
