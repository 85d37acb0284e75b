#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fdu::du
{

// "512B", "4.0K", "3.4M", ... using the binary ladder K through Z.
std::string formatHumanReadable(std::int64_t bytes);

// Parsed argument of -B: a ladder letter (K..Z) or a positive block size.
class BlockSize
{
public:
    // Throws std::invalid_argument when spec is neither.
    static BlockSize parse(std::string_view spec);

    // Rounds up: "1M" for a unit letter, a bare count for a numeric size.
    std::string format(std::int64_t bytes) const;

    bool isUnit() const noexcept { return unit != '\0'; }

private:
    char unit = '\0';
    int shift = 0;
    std::int64_t bytes = 0;
};

class SizeRenderer
{
public:
    enum class Mode
    {
        Raw,
        HumanReadable,
        BlockSize
    };

    SizeRenderer() = default;
    explicit SizeRenderer(Mode mode);
    explicit SizeRenderer(BlockSize blockSize);

    // BlockSize when blockSpec is set (may throw std::invalid_argument),
    // HumanReadable for -h, Raw otherwise.
    static SizeRenderer select(bool humanReadable, std::string_view blockSpec);

    std::string render(std::int64_t size) const;

private:
    Mode currentMode = Mode::Raw;
    std::optional<BlockSize> blockSize;
};

// Parses sizes such as "0", "512", "1M", "1.5G", "-10K", "2MiB".
std::optional<std::int64_t> parseSizeValue(std::string_view input);

} // namespace fdu::du
