#pragma once

/// @file filesystem.hpp
/// @brief Filesystem seam for plugin roots.
///
/// All manifest probing goes through IPluginFilesystem so that workers can
/// run against the real disk in production and an in-memory tree in tests.

#include <filesystem>
#include <string>
#include <vector>

#include "intg/foundation/loader_result.hpp"

namespace intg::loader {

/// Read-only view of the directories holding plugins.
///
/// Implementations must be safe to call from several worker threads at once.
class IPluginFilesystem {
public:
    virtual ~IPluginFilesystem() = default;

    /// True if @p path names an existing directory.
    [[nodiscard]] virtual bool IsDirectory(const std::filesystem::path& path) const = 0;

    /// True if @p path names an existing regular file.
    [[nodiscard]] virtual bool IsFile(const std::filesystem::path& path) const = 0;

    /// Read the whole file as text.
    [[nodiscard]] virtual foundation::LoaderResult<std::string> ReadText(
        const std::filesystem::path& path) const = 0;

    /// Names (not paths) of the immediate subdirectories of @p path, sorted.
    [[nodiscard]] virtual foundation::LoaderResult<std::vector<std::string>>
    ListSubdirectories(const std::filesystem::path& path) const = 0;
};

/// IPluginFilesystem backed by std::filesystem.
class DiskFilesystem final : public IPluginFilesystem {
public:
    [[nodiscard]] bool IsDirectory(const std::filesystem::path& path) const override;
    [[nodiscard]] bool IsFile(const std::filesystem::path& path) const override;
    [[nodiscard]] foundation::LoaderResult<std::string> ReadText(
        const std::filesystem::path& path) const override;
    [[nodiscard]] foundation::LoaderResult<std::vector<std::string>> ListSubdirectories(
        const std::filesystem::path& path) const override;
};

}  // namespace intg::loader
