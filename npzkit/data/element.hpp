#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>

namespace npzkit::data::detail {

  // Complex values are a pair of scalars; each half is swapped on its own.
  template <typename T>
  void
  swap_element_bytes(char* bytes)
  {
    if constexpr (is_complex<T>::value) {
      constexpr auto half = sizeof(T) / 2;
      std::reverse(bytes, bytes + half);
      std::reverse(bytes + half, bytes + sizeof(T));
    } else {
      std::reverse(bytes, bytes + sizeof(T));
    }
  }

  /**
   * @brief Append the little-endian bytes of a value.
   */
  template <typename T>
  void
  store_element(std::string& out, T value)
  {
    char bytes[sizeof(T)];
    if constexpr (std::is_same_v<T, bool>) {
      bytes[0] = value ? 1 : 0;
    } else {
      std::memcpy(bytes, &value, sizeof(T));
      if (sizeof(T) > 1 && native_byte_order() != Byte_order::little) {
        swap_element_bytes<T>(bytes);
      }
    }
    out.append(bytes, sizeof(T));
  }

  /**
   * @brief Read one value stored with the given dtype, which must describe
   * the same element type as T.
   */
  template <typename T>
  T
  load_element(char const* in, Dtype const& dtype)
  {
    char bytes[sizeof(T)];
    std::memcpy(bytes, in, sizeof(T));

    if constexpr (std::is_same_v<T, bool>) {
      return bytes[0] != 0;
    } else {
      if (dtype.needs_swap()) {
        swap_element_bytes<T>(bytes);
      }
      T value;
      std::memcpy(&value, bytes, sizeof(T));
      return value;
    }
  }

} // end of namespace npzkit::data::detail
