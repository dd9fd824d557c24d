// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Written Chinese register requested through the language code.
enum class ChineseVariant : std::uint8_t
{
    None,
    Simplified,  ///< "zh_sim"
    Traditional, ///< "zh_trad"
};

/// @brief Decoding prompt steering the engine towards Simplified Chinese subtitles.
constexpr auto SimplifiedChinesePrompt = std::string_view { "以下是普通话的語音，請使用簡體中文字幕" };

/// @brief Decoding prompt steering the engine towards Traditional Chinese subtitles.
constexpr auto TraditionalChinesePrompt =
    std::string_view { "以下是香港廣東話/台灣國語的語音，請使用繁體中文字幕" };

[[nodiscard]] auto chineseVariant(std::string_view language) -> ChineseVariant;

/// @brief Returns true for "" (same as "auto"), "auto", "zh_sim", "zh_trad" and lowercase 2-3 letter ISO-639 codes.
[[nodiscard]] auto isSupportedLanguage(std::string_view language) -> bool;

/// @brief The language code actually sent to the engine ("zh" for both Chinese variants).
[[nodiscard]] auto effectiveLanguage(std::string_view language) -> std::string;

/// @brief The decoding prompt actually sent to the engine.
///
/// The Chinese variants always use their fixed prompt; otherwise @p callerPrompt is passed through.
[[nodiscard]] auto effectivePrompt(std::string_view language, std::string_view callerPrompt) -> std::string;

} // namespace xcaption
