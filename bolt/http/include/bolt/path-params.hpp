#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "bolt/vector.hpp"

namespace bolt {

struct PathParam {
  std::string_view key;
  std::string_view value;

  bool operator==(const PathParam&) const noexcept = default;
};

// Ordered path captures of one match, in left to right order of the path.
// Keys point into the PathMatcher which produced them, values into the matched path.
// Capacity is fixed at construction and retained by clear() so that a pooled Context never reallocates.
class Params {
 public:
  using const_iterator = const PathParam*;

  // No capacity: PathMatcher::find grows it to its maxParams() before matching.
  Params() noexcept = default;

  explicit Params(uint32_t maxSize) : _maxSize(maxSize) { _params.reserve(maxSize); }

  [[nodiscard]] uint32_t maxSize() const noexcept { return _maxSize; }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] const PathParam& operator[](std::size_t pos) const noexcept { return _params[pos]; }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.data() + _params.size(); }

  // Value bound to 'key', if any. With duplicated keys the first capture wins.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept {
    const auto it = std::find_if(begin(), end(), [key](const PathParam& param) { return param.key == key; });
    if (it == end()) {
      return std::nullopt;
    }
    return it->value;
  }

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view key) const noexcept {
    return get(key).value_or(std::string_view{});
  }

  // Throws std::length_error if maxSize() captures are already stored.
  void push_back(std::string_view key, std::string_view value) {
    if (_params.size() == _maxSize) {
      throw std::length_error(std::format("Too many path parameters, maximum is {}", _maxSize));
    }
    _params.push_back(PathParam{key, value});
  }

  void clear() noexcept { _params.clear(); }

 private:
  vector<PathParam> _params;
  uint32_t _maxSize{0};
};

}  // namespace bolt
