#include "fdu/du/size_format.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fdu::du
{
namespace
{
struct LadderUnit
{
    char letter;
    int shift;
};

constexpr std::array<LadderUnit, 7> kLadder{{
    {'K', 10},
    {'M', 20},
    {'G', 30},
    {'T', 40},
    {'P', 50},
    {'E', 60},
    {'Z', 70},
}};

const LadderUnit *findUnit(char letter) noexcept
{
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    for (const auto &unit : kLadder)
    {
        if (unit.letter == upper)
            return &unit;
    }
    return nullptr;
}

std::int64_t divideRoundingUp(std::int64_t value, std::int64_t divisor) noexcept
{
    if (value <= 0)
        return 0;
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

std::string_view trim(std::string_view view) noexcept
{
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return view;
}

std::optional<int> suffixShift(std::string_view suffix) noexcept
{
    if (suffix.empty())
        return 0;
    if (suffix.size() == 1 && (suffix[0] == 'b' || suffix[0] == 'B'))
        return 0;

    const LadderUnit *unit = findUnit(suffix[0]);
    if (!unit)
        return std::nullopt;
    suffix.remove_prefix(1);
    if (suffix.empty())
        return unit->shift;
    if (suffix.size() == 1 && (suffix[0] == 'b' || suffix[0] == 'B'))
        return unit->shift;
    if (suffix.size() == 2 && (suffix[0] == 'i' || suffix[0] == 'I') && (suffix[1] == 'b' || suffix[1] == 'B'))
        return unit->shift;
    return std::nullopt;
}

} // namespace

std::string formatHumanReadable(std::int64_t bytes)
{
    if (bytes < 1024)
        return std::to_string(bytes) + "B";

    const LadderUnit *chosen = &kLadder.back();
    for (const auto &unit : kLadder)
    {
        if (unit.shift + 10 >= 63 || bytes < (std::int64_t{1} << (unit.shift + 10)))
        {
            chosen = &unit;
            break;
        }
    }

    double value = std::ldexp(static_cast<double>(bytes), -chosen->shift);
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << chosen->letter;
    return out.str();
}

BlockSize BlockSize::parse(std::string_view spec)
{
    BlockSize result;
    if (spec.size() == 1)
    {
        if (const LadderUnit *unit = findUnit(spec[0]))
        {
            result.unit = unit->letter;
            result.shift = unit->shift;
            return result;
        }
    }

    std::int64_t value = 0;
    const char *begin = spec.data();
    const char *end = spec.data() + spec.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (spec.empty() || ec != std::errc() || ptr != end || value <= 0)
        throw std::invalid_argument("-B requires a valid argument");
    result.bytes = value;
    return result;
}

std::string BlockSize::format(std::int64_t size) const
{
    if (isUnit())
    {
        std::int64_t count = 0;
        if (shift >= 63)
            count = size > 0 ? 1 : 0;
        else
            count = divideRoundingUp(size, std::int64_t{1} << shift);
        return std::to_string(count) + unit;
    }
    return std::to_string(divideRoundingUp(size, bytes));
}

SizeRenderer::SizeRenderer(Mode mode)
    : currentMode(mode)
{
    if (mode == Mode::BlockSize)
        throw std::invalid_argument("block size mode requires a block size");
}

SizeRenderer::SizeRenderer(BlockSize size)
    : currentMode(Mode::BlockSize), blockSize(size)
{
}

SizeRenderer SizeRenderer::select(bool humanReadable, std::string_view blockSpec)
{
    if (!blockSpec.empty())
        return SizeRenderer(BlockSize::parse(blockSpec));
    if (humanReadable)
        return SizeRenderer(Mode::HumanReadable);
    return SizeRenderer(Mode::Raw);
}

std::string SizeRenderer::render(std::int64_t size) const
{
    switch (currentMode)
    {
    case Mode::HumanReadable:
        return formatHumanReadable(size);
    case Mode::BlockSize:
        return blockSize->format(size);
    case Mode::Raw:
        break;
    }
    return std::to_string(size);
}

std::optional<std::int64_t> parseSizeValue(std::string_view input)
{
    std::string_view text = trim(input);
    if (text.empty())
        return std::int64_t{0};

    bool negative = false;
    if (text.front() == '+' || text.front() == '-')
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    std::size_t pos = 0;
    std::uint64_t whole = 0;
    bool sawDigit = false;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
    {
        unsigned digit = static_cast<unsigned>(text[pos] - '0');
        if (whole > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            return std::nullopt;
        whole = whole * 10 + digit;
        sawDigit = true;
        ++pos;
    }

    double fraction = 0.0;
    bool hasFraction = false;
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        double scale = 0.1;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            fraction += scale * static_cast<double>(text[pos] - '0');
            scale /= 10.0;
            hasFraction = true;
            sawDigit = true;
            ++pos;
        }
    }
    if (!sawDigit)
        return std::nullopt;

    std::optional<int> shift = suffixShift(text.substr(pos));
    if (!shift)
        return std::nullopt;

    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::uint64_t magnitude = 0;
    if (!hasFraction)
    {
        if (whole != 0 && (*shift >= 63 || whole > (kMax >> *shift)))
            return std::nullopt;
        magnitude = whole << *shift;
    }
    else
    {
        double value = std::ldexp(static_cast<double>(whole) + fraction, *shift);
        if (value >= 9.2e18)
            return std::nullopt;
        magnitude = static_cast<std::uint64_t>(value);
    }
    if (magnitude > kMax)
        return std::nullopt;

    auto result = static_cast<std::int64_t>(magnitude);
    return negative ? -result : result;
}

} // namespace fdu::du
