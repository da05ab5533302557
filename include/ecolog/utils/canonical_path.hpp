#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace ecolog {

// File system path normalized once at construction; the key type for
// workspace roots and indexed files.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  auto ToUri() const -> std::string;

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;

  auto Empty() const -> bool;

  auto IsSubPathOf(const CanonicalPath& other) const -> bool;

  // Path relative to `base` with forward slashes, for pattern matching
  auto RelativeTo(const CanonicalPath& base) const -> std::string;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() < rhs.String();
  }

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace ecolog

template <>
struct fmt::formatter<ecolog::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const ecolog::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<ecolog::CanonicalPath> {
  auto operator()(const ecolog::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
