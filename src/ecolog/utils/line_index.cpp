#include "ecolog/utils/line_index.hpp"

#include <algorithm>

namespace ecolog::utils {

namespace {

// UTF-16 code units for the UTF-8 sequence starting with `lead`
auto Utf16Units(unsigned char lead) -> uint32_t {
  if ((lead & 0xC0) == 0x80) {
    return 0;  // continuation byte
  }
  return (lead >= 0xF0) ? 2 : 1;
}

}  // namespace

LineIndex::LineIndex(std::string_view text) : text_(text) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

auto LineIndex::LineEnd(std::size_t line) const -> std::size_t {
  if (line + 1 < line_starts_.size()) {
    return line_starts_[line + 1] - 1;
  }
  return text_.size();
}

auto LineIndex::ToPosition(uint32_t row, uint32_t byte_column) const
    -> Position {
  if (row >= line_starts_.size()) {
    return Position{.line = row, .character = byte_column};
  }
  auto begin = line_starts_[row];
  auto end = std::min(begin + byte_column, text_.size());
  uint32_t units = 0;
  for (auto i = begin; i < end; ++i) {
    units += Utf16Units(static_cast<unsigned char>(text_[i]));
  }
  return Position{.line = row, .character = units};
}

auto LineIndex::ToPosition(std::size_t byte_offset) const -> Position {
  byte_offset = std::min(byte_offset, text_.size());
  auto it = std::ranges::upper_bound(line_starts_, byte_offset);
  auto row = static_cast<uint32_t>(
      std::distance(line_starts_.begin(), it) - 1);
  return ToPosition(
      row, static_cast<uint32_t>(byte_offset - line_starts_[row]));
}

auto LineIndex::ToByteOffset(const Position& position) const
    -> std::optional<std::size_t> {
  if (position.line >= line_starts_.size()) {
    return std::nullopt;
  }
  auto offset = line_starts_[position.line];
  auto end = LineEnd(position.line);
  uint32_t units = 0;
  while (offset < end && units < position.character) {
    auto lead = static_cast<unsigned char>(text_[offset]);
    units += Utf16Units(lead);
    ++offset;
    while (offset < end &&
           (static_cast<unsigned char>(text_[offset]) & 0xC0) == 0x80) {
      ++offset;
    }
  }
  return offset;
}

}  // namespace ecolog::utils
