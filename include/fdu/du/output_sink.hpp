#pragma once

#include "fdu/du/size_format.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace fdu::du
{

struct ReportPolicy
{
    // 0 reports everything, T > 0 reports sizes >= T, T < 0 reports sizes <= -T.
    std::int64_t threshold = 0;
    bool summarize = false;
    bool listFiles = false;
};

bool passesThreshold(std::int64_t size, std::int64_t threshold) noexcept;

// Buffered writer of "{size:<10} {path}" lines, in call order.
class OutputSink
{
public:
    OutputSink(std::ostream &out, SizeRenderer renderer, ReportPolicy policy);
    ~OutputSink();

    OutputSink(const OutputSink &) = delete;
    OutputSink &operator=(const OutputSink &) = delete;

    void reportDirectory(std::int64_t size, std::string_view path);
    void reportFile(std::int64_t size, std::string_view path);
    void writeLine(std::int64_t size, std::string_view path);

    void flush();

private:
    static constexpr std::size_t kFlushThreshold = 64 * 1024;

    std::ostream &stream;
    SizeRenderer sizeRenderer;
    ReportPolicy reportPolicy;
    std::string buffer;
};

} // namespace fdu::du
