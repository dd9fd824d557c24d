// SPDX-License-Identifier: Apache-2.0
#include "SubtitleCodec.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>

namespace xcaption
{

namespace
{

    constexpr auto Whitespace = std::string_view { " \t\r\n\f\v" };

    /// @brief Subtitle-ready spelling of a timestamp: the engine's own text, or a formatted timecode.
    auto subtitleStamp(double seconds, std::string_view stamp) -> std::string
    {
        if (stamp.empty())
            return formatTimecode(seconds);

        auto text = std::string(stamp);
        if (auto const dot = text.find('.'); dot != std::string::npos)
            text[dot] = ',';
        return text;
    }

    auto parseNonNegative(std::string_view text) -> std::optional<double>
    {
        if (text.empty())
            return std::nullopt;

        auto value = 0.0;
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc {} || ptr != end || !std::isfinite(value) || value < 0.0
            || value > MaxTimestampSeconds)
            return std::nullopt;
        return value;
    }

    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        while (!text.empty())
        {
            auto const newline = text.find('\n');
            auto line = text.substr(0, newline);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.push_back(line);
            if (newline == std::string_view::npos)
                break;
            text.remove_prefix(newline + 1);
        }
        return lines;
    }

    auto parseBlock(std::span<const std::string_view> lines) -> std::optional<Segment>
    {
        if (lines.size() < 2)
            return std::nullopt;

        auto const timeLineIndex = lines[1].find("-->") != std::string_view::npos ? 1uz : 0uz;
        auto const timeLine = lines[timeLineIndex];
        auto const arrow = timeLine.find("-->");
        if (arrow == std::string_view::npos)
            return std::nullopt;

        auto const start = parseTimeString(timeLine.substr(0, arrow));
        auto const end = parseTimeString(timeLine.substr(arrow + 3));
        if (!start || !end)
            return std::nullopt;

        auto text = std::string {};
        for (auto const line: lines.subspan(timeLineIndex + 1))
        {
            if (!text.empty())
                text += ' ';
            text += line;
        }
        if (text.empty())
            return std::nullopt;

        return Segment { .start = *start, .end = *end, .text = std::move(text), .startStamp = {}, .endStamp = {} };
    }

} // namespace

auto trimWhitespace(std::string_view text) -> std::string_view
{
    auto const first = text.find_first_not_of(Whitespace);
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(Whitespace);
    return text.substr(first, last - first + 1);
}

auto formatTimecode(double seconds) -> std::string
{
    auto const clamped = std::isfinite(seconds) ? std::clamp(seconds, 0.0, MaxTimestampSeconds) : 0.0;

    // The epsilon keeps values such as 1.001 from truncating to 1.000.
    auto const totalMillis = static_cast<std::int64_t>(std::floor(clamped * 1000.0 + 1e-6));

    auto const hours = totalMillis / 3'600'000;
    auto const minutes = (totalMillis / 60'000) % 60;
    auto const secs = (totalMillis / 1000) % 60;
    auto const millis = totalMillis % 1000;

    return std::format("{:02}:{:02}:{:02},{:03}", hours, minutes, secs, millis);
}

auto toSubtitleText(std::span<const Segment> segments) -> std::optional<std::string>
{
    auto output = std::string {};
    auto index = 1;

    for (auto const& segment: segments)
    {
        auto const text = trimWhitespace(segment.text);
        if (text.empty())
            continue;

        if (!output.empty())
            output += "\n\n";

        output += std::format("{}\n{} --> {}\n{}",
                              index,
                              subtitleStamp(segment.start, segment.startStamp),
                              subtitleStamp(segment.end, segment.endStamp),
                              text);
        ++index;
    }

    if (output.empty())
        return std::nullopt;
    return output;
}

auto parseTimeString(std::string_view text) -> std::optional<double>
{
    auto cleaned = std::string(trimWhitespace(text));
    if (cleaned.empty())
        return std::nullopt;
    std::ranges::replace(cleaned, ',', '.');

    auto parts = std::vector<double> {};
    auto rest = std::string_view { cleaned };
    while (true)
    {
        auto const colon = rest.find(':');
        auto const value = parseNonNegative(rest.substr(0, colon));
        if (!value)
            return std::nullopt;
        parts.push_back(*value);
        if (colon == std::string_view::npos)
            break;
        rest.remove_prefix(colon + 1);
    }

    auto seconds = 0.0;
    switch (parts.size())
    {
        case 1: seconds = parts[0]; break;
        case 2: seconds = parts[0] * 60.0 + parts[1]; break;
        case 3: seconds = parts[0] * 3600.0 + parts[1] * 60.0 + parts[2]; break;
        default: return std::nullopt;
    }

    if (seconds > MaxTimestampSeconds)
        return std::nullopt;
    return seconds;
}

auto parseSubtitleText(std::string_view text) -> std::vector<Segment>
{
    auto segments = std::vector<Segment> {};
    auto block = std::vector<std::string_view> {};

    auto const flush = [&] {
        if (auto segment = parseBlock(block))
            segments.push_back(std::move(*segment));
        block.clear();
    };

    for (auto const line: splitLines(text))
    {
        auto const trimmed = trimWhitespace(line);
        if (trimmed.empty())
            flush();
        else
            block.push_back(trimmed);
    }
    flush();

    return segments;
}

} // namespace xcaption
