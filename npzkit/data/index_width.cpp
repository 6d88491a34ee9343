#include <npzkit/data/index_width.hpp>

//
// ... Standard header files
//
#include <algorithm>

namespace npzkit::data::detail {

  Index_width
  select_index_width(std::span<std::int64_t const> values)
  {
    auto fits = [](std::int64_t value) {
      return value >= std::numeric_limits<std::int32_t>::min() &&
             value <= std::numeric_limits<std::int32_t>::max();
    };
    return std::all_of(values.begin(), values.end(), fits) ? Index_width::narrow
                                                           : Index_width::wide;
  }

  Dtype
  index_dtype(Index_width width)
  {
    return width == Index_width::narrow ? Dtype::of<std::int32_t>() : Dtype::of<std::int64_t>();
  }

  std::optional<std::vector<std::int64_t>>
  widen_indices(Npy_array const& array)
  {
    auto const& dtype = array.dtype();
    if (dtype.same_type(Dtype::of<std::int32_t>())) {
      auto narrow = array.as<std::int32_t>();
      return std::vector<std::int64_t>(narrow.begin(), narrow.end());
    }
    if (dtype.same_type(Dtype::of<std::int64_t>())) {
      return array.as<std::int64_t>();
    }
    return std::nullopt;
  }

} // end of namespace npzkit::data::detail
