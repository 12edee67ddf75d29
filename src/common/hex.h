#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <oxenmq/hex.h>

namespace tools {
  /// Converts a trivially copyable, padding-free type into a hex string of its contents.
  template <typename T, typename = std::enable_if_t<
      std::is_standard_layout_v<T> && std::has_unique_object_representations_v<T>>>
  std::string type_to_hex(const T& val) {
    return oxenmq::to_hex(std::string_view{reinterpret_cast<const char*>(&val), sizeof(val)});
  }

  /// Hex of at most `max` leading bytes of `bytes`, with a trailing "..." when truncated.  Used
  /// wherever a payload is logged so that long streams don't flood the log.
  inline std::string abbreviated_hex(std::string_view bytes, size_t max = 32) {
    if (bytes.size() <= max)
      return oxenmq::to_hex(bytes);
    return oxenmq::to_hex(bytes.substr(0, max)) + "...";
  }
}
