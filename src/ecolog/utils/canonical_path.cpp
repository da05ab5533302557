#include "ecolog/utils/canonical_path.hpp"

#include <algorithm>

#include "ecolog/utils/path_utils.hpp"

namespace ecolog {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizeLexically(NormalizePath(std::move(path)))),
      string_(path_.string()) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  return string_;
}

auto CanonicalPath::Empty() const -> bool {
  return path_.empty();
}

auto CanonicalPath::IsSubPathOf(const CanonicalPath& other) const -> bool {
  return std::mismatch(other.path_.begin(), other.path_.end(), path_.begin(),
                       path_.end())
             .first == other.path_.end();
}

auto CanonicalPath::RelativeTo(const CanonicalPath& base) const
    -> std::string {
  return path_.lexically_relative(base.path_).generic_string();
}

auto CanonicalPath::operator/(const std::filesystem::path& rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace ecolog
