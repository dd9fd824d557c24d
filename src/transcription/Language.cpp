// SPDX-License-Identifier: Apache-2.0
#include "Language.hpp"

#include <algorithm>

namespace xcaption
{

auto chineseVariant(std::string_view language) -> ChineseVariant
{
    if (language == "zh_sim")
        return ChineseVariant::Simplified;
    if (language == "zh_trad")
        return ChineseVariant::Traditional;
    return ChineseVariant::None;
}

auto isSupportedLanguage(std::string_view language) -> bool
{
    if (language.empty() || language == "auto" || chineseVariant(language) != ChineseVariant::None)
        return true;

    return (language.size() == 2 || language.size() == 3)
           && std::ranges::all_of(language, [](char c) { return c >= 'a' && c <= 'z'; });
}

auto effectiveLanguage(std::string_view language) -> std::string
{
    if (language.empty())
        return "auto";
    if (chineseVariant(language) != ChineseVariant::None)
        return "zh";
    return std::string(language);
}

auto effectivePrompt(std::string_view language, std::string_view callerPrompt) -> std::string
{
    switch (chineseVariant(language))
    {
        case ChineseVariant::Simplified: return std::string(SimplifiedChinesePrompt);
        case ChineseVariant::Traditional: return std::string(TraditionalChinesePrompt);
        case ChineseVariant::None: break;
    }
    return std::string(callerPrompt);
}

} // namespace xcaption
