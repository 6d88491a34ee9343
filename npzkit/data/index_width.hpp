#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/Npy_array.hpp>

namespace npzkit::data::detail {

  /**
   * @brief Storage width of an index or offset array on disk.
   *
   * scipy stores index arrays as int32 when every value fits and int64
   * otherwise. The choice is made per array.
   */
  enum class Index_width { narrow, wide };

  /**
   * @brief Choose `narrow` when every value lies in the int32 range.
   */
  Index_width
  select_index_width(std::span<std::int64_t const> values);

  /**
   * @brief The dtype written for a width: `<i4` or `<i8`.
   */
  Dtype
  index_dtype(Index_width width);

  /**
   * @brief Widen a stored `i4` or `i8` array (either byte order) to int64.
   *
   * Returns nothing when the array holds any other element type.
   */
  std::optional<std::vector<std::int64_t>>
  widen_indices(Npy_array const& array);

  /**
   * @brief Convert unsigned indices to the signed values written on disk.
   *
   * Throws std::invalid_argument when a value exceeds the int64 range.
   */
  template <typename U>
  std::vector<std::int64_t>
  to_signed_indices(std::string const& name, std::span<U const> values)
  {
    constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    std::vector<std::int64_t> result;
    result.reserve(values.size());
    for (auto value : values) {
      if (static_cast<std::uint64_t>(value) > max) {
        throw std::invalid_argument(
          "index " + std::to_string(value) + " in '" + name + "' exceeds the int64 range");
      }
      result.push_back(static_cast<std::int64_t>(value));
    }
    return result;
  }

} // end of namespace npzkit::data::detail
