// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <transcription/Language.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace xcaption
{

/// @brief Converts text between Chinese writing systems.
class ScriptConverter
{
  public:
    virtual ~ScriptConverter() = default;

    [[nodiscard]] virtual auto convert(std::string_view text) const -> Result<std::string> = 0;
};

/// @brief OpenCC configuration used for a Chinese variant.
///
/// Simplified output converts Hong Kong Traditional to Mainland Simplified ("hk2s.json"),
/// Traditional output converts Mainland Simplified to Taiwan Traditional ("s2tw.json").
/// @return The configuration filename, or an empty view for ChineseVariant::None.
[[nodiscard]] auto scriptConversionConfig(ChineseVariant variant) -> std::string_view;

/// @brief ScriptConverter backed by the OpenCC library.
class OpenccScriptConverter final: public ScriptConverter
{
  private:
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

  public:
    /// @brief Only reachable through create().
    explicit OpenccScriptConverter(ConstructionKey);
    ~OpenccScriptConverter() override;

    OpenccScriptConverter(const OpenccScriptConverter&) = delete;
    OpenccScriptConverter& operator=(const OpenccScriptConverter&) = delete;

    /// @brief Loads an OpenCC configuration by name (e.g. "s2tw.json").
    [[nodiscard]] static auto create(const std::string& configName) -> Result<std::unique_ptr<OpenccScriptConverter>>;

    [[nodiscard]] auto convert(std::string_view text) const -> Result<std::string> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Creates the converter matching a requested language code.
/// @return nullptr for languages other than "zh_sim" and "zh_trad".
[[nodiscard]] auto makeScriptConverter(std::string_view language) -> Result<std::unique_ptr<ScriptConverter>>;

} // namespace xcaption
