#include "ecolog/utils/path_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

#include <fmt/format.h>

namespace ecolog {

auto ExtensionOf(const std::filesystem::path& path) -> std::string {
  std::string ext = path.extension().string();
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext;
}

auto IsIgnoredDirectory(const std::filesystem::path& path) -> bool {
  static constexpr std::array<std::string_view, 9> kIgnored = {
      "node_modules", ".git",   "target", "dist",  "build",
      "__pycache__",  ".venv", "vendor", ".cache"};
  auto name = path.filename().string();
  return std::ranges::find(kIgnored, name) != kIgnored.end();
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with("file://")) {
    return {uri};
  }

  std::string path(uri.substr(7));

  // file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }

  static const std::regex kEscapeRegex("%([0-9A-Fa-f]{2})");

  std::string result;
  std::regex_iterator<std::string::iterator> it(
      path.begin(), path.end(), kEscapeRegex);
  std::regex_iterator<std::string::iterator> end;

  std::size_t last_pos = 0;
  while (it != end) {
    result.append(path, last_pos, it->position() - last_pos);
    std::string hex = (*it)[1];
    result += static_cast<char>(std::stoi(hex, nullptr, 16));
    last_pos = it->position() + it->length();
    ++it;
  }

  result.append(path, last_pos, path.length() - last_pos);
  return NormalizePath(result);
}

auto PathToUri(std::filesystem::path path) -> std::string {
  std::string result = "file://";

  if (path.string().size() >= 2 && path.string()[1] == ':') {
    result += '/';
  }

  for (char c : path.generic_string()) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }
  return path;
}

auto NormalizeLexically(const std::filesystem::path& path)
    -> std::filesystem::path {
  auto normal = path.lexically_normal();
  // lexically_normal keeps a trailing separator as an empty element
  if (!normal.empty() && !normal.has_filename()) {
    normal = normal.parent_path();
  }
  return normal;
}

}  // namespace ecolog
