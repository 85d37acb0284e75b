#include "fdu/du/output_sink.hpp"

#include <utility>

namespace fdu::du
{
namespace
{
constexpr std::size_t kSizeColumnWidth = 10;
}

bool passesThreshold(std::int64_t size, std::int64_t threshold) noexcept
{
    if (threshold == 0)
        return true;
    if (threshold > 0)
        return size >= threshold;
    return size <= -threshold;
}

OutputSink::OutputSink(std::ostream &out, SizeRenderer renderer, ReportPolicy policy)
    : stream(out), sizeRenderer(std::move(renderer)), reportPolicy(policy)
{
    buffer.reserve(kFlushThreshold + 256);
}

OutputSink::~OutputSink()
{
    flush();
}

void OutputSink::reportDirectory(std::int64_t size, std::string_view path)
{
    if (reportPolicy.summarize || !passesThreshold(size, reportPolicy.threshold))
        return;
    writeLine(size, path);
}

void OutputSink::reportFile(std::int64_t size, std::string_view path)
{
    if (!reportPolicy.listFiles)
        return;
    reportDirectory(size, path);
}

void OutputSink::writeLine(std::int64_t size, std::string_view path)
{
    std::string formatted = sizeRenderer.render(size);
    buffer.append(formatted);
    if (formatted.size() < kSizeColumnWidth)
        buffer.append(kSizeColumnWidth - formatted.size(), ' ');
    buffer.push_back(' ');
    buffer.append(path);
    buffer.push_back('\n');

    if (buffer.size() >= kFlushThreshold)
        flush();
}

void OutputSink::flush()
{
    if (!buffer.empty())
    {
        stream.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        buffer.clear();
    }
    stream.flush();
}

} // namespace fdu::du
