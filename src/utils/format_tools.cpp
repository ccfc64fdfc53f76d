// format_tools.cpp
#include "simpaths/format_tools.hpp"

#include <cctype>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace simpaths::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is
// computed separately so the result does not depend on fmt's %S subsecond
// behaviour, which changed between fmt releases.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

static bool is_unreserved(unsigned char c) noexcept
{
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
}

std::string percent_encode(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input)
    {
        if (is_unreserved(c))
        {
            out += static_cast<char>(c);
        }
        else
        {
            fmt::format_to(std::back_inserter(out), "%{:02X}", static_cast<unsigned>(c));
        }
    }
    return out;
}

static int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        if (input[i] != '%')
        {
            out += input[i];
            continue;
        }
        if (i + 2 >= input.size())
        {
            return std::nullopt;
        }
        int hi = hex_value(input[i + 1]);
        int lo = hex_value(input[i + 2]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

double to_epoch_seconds(std::chrono::system_clock::time_point timestamp) noexcept
{
    return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
}

} // namespace simpaths::format_tools
