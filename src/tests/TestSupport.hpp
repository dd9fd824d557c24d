// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

namespace xcaption::test
{

/// @brief Uniquely named directory below the system temp directory, removed on destruction.
class TempDir
{
  public:
    explicit TempDir(std::string_view prefix = "xcaption_test")
    {
        static auto counter = std::atomic<int> { 0 };
        auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        _path = std::filesystem::temp_directory_path() / std::format("{}_{}_{}", prefix, stamp, counter++);
        std::filesystem::create_directories(_path);
    }

    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

    /// @brief Writes @p content to @p name inside the directory and returns the file's path.
    auto write(std::string_view name, std::string_view content) const -> std::filesystem::path
    {
        auto const file = _path / name;
        auto out = std::ofstream(file, std::ios::binary);
        out << content;
        return file;
    }

  private:
    std::filesystem::path _path;
};

} // namespace xcaption::test
