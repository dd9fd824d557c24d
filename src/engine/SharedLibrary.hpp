// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>

namespace xcaption
{

/// @brief Move-only owner of a dynamically loaded shared library.
class SharedLibrary
{
  public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;
    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /// @brief Loads the library at @p path with all symbols resolved immediately.
    /// @return The library, or an EngineLoadFailed error carrying the system loader's message
    ///         in both `message` and `originalMessage`.
    [[nodiscard]] static auto open(const std::filesystem::path& path) -> Result<SharedLibrary>;

    /// @brief Looks up an exported symbol.
    /// @return The symbol address, or nullptr if it is not exported.
    [[nodiscard]] auto symbol(const std::string& name) const -> void*;

    [[nodiscard]] auto isOpen() const noexcept -> bool { return _handle != nullptr; }

  private:
    explicit SharedLibrary(void* handle) noexcept: _handle(handle) {}

    void close() noexcept;

    void* _handle = nullptr;
};

} // namespace xcaption
