/// @file disk_filesystem.cpp
/// @brief std::filesystem implementation of IPluginFilesystem.

#include "intg/loader/filesystem.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

using intg::foundation::ErrorCode;
using intg::foundation::LoaderError;
using intg::foundation::LoaderResult;

namespace intg::loader {

bool DiskFilesystem::IsDirectory(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool DiskFilesystem::IsFile(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

LoaderResult<std::string> DiskFilesystem::ReadText(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return LoaderResult<std::string>::err(
            LoaderError(ErrorCode::FilesystemError, "Cannot open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return LoaderResult<std::string>::err(
            LoaderError(ErrorCode::FilesystemError, "Read failed for " + path.string()));
    }
    return LoaderResult<std::string>::ok(buffer.str());
}

LoaderResult<std::vector<std::string>> DiskFilesystem::ListSubdirectories(
    const std::filesystem::path& path) const {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        return LoaderResult<std::vector<std::string>>::err(LoaderError(
            ErrorCode::FilesystemError, "Cannot list " + path.string() + ": " + ec.message()));
    }
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (entry.is_directory(entryEc)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return LoaderResult<std::vector<std::string>>::ok(std::move(names));
}

}  // namespace intg::loader
