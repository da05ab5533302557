#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "ecolog/core/range.hpp"

namespace ecolog::utils {

// Maps between UTF-8 byte offsets and (line, UTF-16 column) positions.
// Holds a view of the text; the owner keeps the text alive.
class LineIndex {
 public:
  explicit LineIndex(std::string_view text);

  // Byte column within `row` to a UTF-16 position
  [[nodiscard]] auto ToPosition(uint32_t row, uint32_t byte_column) const
      -> Position;

  [[nodiscard]] auto ToPosition(std::size_t byte_offset) const -> Position;

  // Nothing when the line is out of range; columns past the line end clamp
  // to it.
  [[nodiscard]] auto ToByteOffset(const Position& position) const
      -> std::optional<std::size_t>;

  [[nodiscard]] auto LineCount() const -> std::size_t {
    return line_starts_.size();
  }

 private:
  [[nodiscard]] auto LineEnd(std::size_t line) const -> std::size_t;

  std::string_view text_;
  std::vector<std::size_t> line_starts_;
};

}  // namespace ecolog::utils
