// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Ids.hpp>

#include <filesystem>
#include <fstream>
#include <string_view>

namespace agentloop::testing
{

/// @brief A fresh directory under the system temp dir, removed on destruction.
class TempWorkspace
{
  public:
    TempWorkspace(): _path(std::filesystem::temp_directory_path() / ("agentloop-test-" + createId()))
    {
        std::filesystem::create_directories(_path);
    }

    ~TempWorkspace()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

    /// @brief Writes @p content to a workspace-relative file, creating parent directories.
    void write(std::string_view relative, std::string_view content) const
    {
        auto const target = _path / relative;
        std::filesystem::create_directories(target.parent_path());
        auto file = std::ofstream(target, std::ios::binary);
        file << content;
    }

  private:
    std::filesystem::path _path;
};

} // namespace agentloop::testing
