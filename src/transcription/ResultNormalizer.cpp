// SPDX-License-Identifier: Apache-2.0
#include "ResultNormalizer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <transcription/Language.hpp>
#include <transcription/SubtitleCodec.hpp>

#include <algorithm>
#include <cmath>

namespace xcaption
{

namespace
{

    struct Timestamp
    {
        double seconds = 0.0;
        std::string stamp;
    };

    auto readTimestamp(const nlohmann::json* value) -> std::optional<Timestamp>
    {
        if (!value)
            return std::nullopt;

        if (value->is_number())
        {
            auto const seconds = value->get<double>();
            if (!std::isfinite(seconds) || seconds < 0.0 || seconds > MaxTimestampSeconds)
                return std::nullopt;
            return Timestamp { .seconds = seconds, .stamp = {} };
        }

        if (value->is_string())
        {
            auto const& text = value->get_ref<const std::string&>();
            if (auto const seconds = parseTimeString(text))
                return Timestamp { .seconds = *seconds, .stamp = std::string(trimWhitespace(text)) };
        }

        return std::nullopt;
    }

    auto readText(const nlohmann::json& entry) -> std::string
    {
        for (auto const key: { "text", "text_segment", "content" })
        {
            auto const it = entry.find(key);
            if (it != entry.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
                return it->get<std::string>();
        }
        return {};
    }

    auto looksLikeSegment(const nlohmann::json& value) -> bool
    {
        return value.is_object() && (value.contains("start") || value.contains("from"));
    }

    auto classify(const nlohmann::json& value, ShapeProbe probe) -> ShapeProbe
    {
        if (value.is_array())
        {
            probe.shape = ParsedShape::SegmentSequence;
            probe.segments = value;
            return probe;
        }

        if (!value.is_object())
            return probe;

        probe.detectedLanguage = json::getStringOr(value, "language", "");

        for (auto const key: SegmentContainerKeys)
        {
            auto const it = value.find(std::string(key));
            if (it != value.end() && it->is_array())
            {
                probe.shape = ParsedShape::KeyedSegments;
                probe.segments = *it;
                return probe;
            }
        }

        // Compatibility shim for engines that emit segments as object members.
        for (auto const& item: value)
        {
            if (looksLikeSegment(item))
                probe.segments.push_back(item);
        }
        if (!probe.segments.empty())
            probe.shape = ParsedShape::ScannedValues;
        return probe;
    }

    auto convertText(std::string text, const ScriptConverter& converter) -> std::string
    {
        auto converted = converter.convert(text);
        if (!converted)
        {
            log::warning("Script conversion failed, keeping original text: {}", converted.error().message);
            return text;
        }
        return std::move(*converted);
    }

} // namespace

auto discoverShape(const RawEngineResult& raw) -> ShapeProbe
{
    auto const& payload = raw.payload;
    if (!payload.is_string())
        return classify(payload, ShapeProbe {});

    auto parsed = json::parse(payload.get_ref<const std::string&>());
    if (parsed && parsed->is_string())
        parsed = json::parse(parsed->get_ref<const std::string&>());

    auto probe = ShapeProbe {};
    probe.fromText = true;
    if (!parsed)
    {
        probe.shape = ParsedShape::PlainText;
        return probe;
    }
    return classify(*parsed, std::move(probe));
}

auto extractSegment(const nlohmann::json& entry) -> std::optional<Segment>
{
    auto start = std::optional<Timestamp> {};
    auto end = std::optional<Timestamp> {};
    auto text = std::string {};

    if (entry.is_array())
    {
        if (entry.size() < 3)
            return std::nullopt;
        start = readTimestamp(&entry[0]);
        end = readTimestamp(&entry[1]);
        if (entry[2].is_string())
            text = entry[2].get<std::string>();
    }
    else if (entry.is_object())
    {
        start = readTimestamp(json::findFirst(entry, { "start", "from" }));
        end = readTimestamp(json::findFirst(entry, { "end", "to" }));
        text = readText(entry);
    }
    else
        return std::nullopt;

    auto const trimmed = trimWhitespace(text);
    if (!start || !end || trimmed.empty() || end->seconds < start->seconds)
        return std::nullopt;

    return Segment {
        .start = start->seconds,
        .end = end->seconds,
        .text = std::string(trimmed),
        .startStamp = std::move(start->stamp),
        .endStamp = std::move(end->stamp),
    };
}

auto normalizeResult(const RawEngineResult& raw, std::string_view language, const ScriptConverter* converter)
    -> Transcript
{
    auto const probe = discoverShape(raw);

    auto transcript = Transcript {};
    transcript.language = !probe.detectedLanguage.empty() ? probe.detectedLanguage : std::string(language);

    if (probe.shape == ParsedShape::PlainText)
        log::debug("Engine result is not structured data; no timestamps available");

    auto const convert = converter && chineseVariant(language) != ChineseVariant::None;

    for (auto const& entry: probe.segments)
    {
        auto segment = extractSegment(entry);
        if (!segment)
            continue;

        if (convert)
            segment->text = convertText(std::move(segment->text), *converter);

        if (!transcript.text.empty())
            transcript.text += ' ';
        transcript.text += segment->text;
        transcript.duration = std::max(transcript.duration.value_or(0.0), segment->end);
        transcript.segments.push_back(std::move(*segment));
    }

    transcript.hasTimestamps = !transcript.segments.empty();
    return transcript;
}

} // namespace xcaption
