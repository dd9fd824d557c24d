// SPDX-License-Identifier: Apache-2.0
#include "ScriptConverter.hpp"

#include <core/Log.hpp>

#include <opencc/opencc.h>

#include <format>
#include <optional>

namespace xcaption
{

struct OpenccScriptConverter::Impl
{
    std::string configName;
    std::optional<opencc::SimpleConverter> converter;
};

OpenccScriptConverter::OpenccScriptConverter(ConstructionKey): _impl(std::make_unique<Impl>())
{
}

OpenccScriptConverter::~OpenccScriptConverter() = default;

auto scriptConversionConfig(ChineseVariant variant) -> std::string_view
{
    switch (variant)
    {
        case ChineseVariant::Simplified: return "hk2s.json";
        case ChineseVariant::Traditional: return "s2tw.json";
        case ChineseVariant::None: break;
    }
    return {};
}

auto OpenccScriptConverter::create(const std::string& configName) -> Result<std::unique_ptr<OpenccScriptConverter>>
{
    auto instance = std::make_unique<OpenccScriptConverter>(ConstructionKey {});
    instance->_impl->configName = configName;

    // OpenCC reports missing or malformed configuration data by throwing.
    try
    {
        instance->_impl->converter.emplace(configName);
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::ConfigError,
                         std::format("Failed to load OpenCC configuration '{}': {}", configName, e.what()));
    }

    log::debug("OpenCC converter ready ({})", configName);
    return instance;
}

auto OpenccScriptConverter::convert(std::string_view text) const -> Result<std::string>
{
    try
    {
        return _impl->converter->Convert(std::string(text));
    }
    catch (const std::exception& e)
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("OpenCC conversion ({}) failed: {}", _impl->configName, e.what()));
    }
}

auto makeScriptConverter(std::string_view language) -> Result<std::unique_ptr<ScriptConverter>>
{
    auto const config = scriptConversionConfig(chineseVariant(language));
    if (config.empty())
        return std::unique_ptr<ScriptConverter> {};

    auto converter = OpenccScriptConverter::create(std::string(config));
    if (!converter)
        return std::unexpected(converter.error());
    return std::unique_ptr<ScriptConverter>(std::move(*converter));
}

} // namespace xcaption
