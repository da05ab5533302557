#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ecolog {

// Lowercased extension including the dot, or "" when there is none
[[nodiscard]] auto ExtensionOf(const std::filesystem::path& path)
    -> std::string;

// Directories never descended into during workspace discovery
[[nodiscard]] auto IsIgnoredDirectory(const std::filesystem::path& path)
    -> bool;

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(std::filesystem::path path) -> std::string;

// Canonicalizes paths that exist on disk, returns others unchanged
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// Resolves "." and ".." without touching the file system
[[nodiscard]] auto NormalizeLexically(const std::filesystem::path& path)
    -> std::filesystem::path;

}  // namespace ecolog
