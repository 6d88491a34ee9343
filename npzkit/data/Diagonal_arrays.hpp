#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data/Shape.hpp>

namespace npzkit::data::detail {

  /**
   * @brief Raw arrays of a `scipy.sparse.dia_matrix`.
   *
   * `data` holds a C-ordered block of shape [offsets.size(), length]: one
   * row per stored diagonal. scipy places the value at (i, i + offset) in
   * column i + offset of its row, so `length` is usually between 0 and
   * ncol. Offsets may appear in any order; negative offsets are below the
   * main diagonal.
   */
  template <typename T = config::value_type>
  struct Diagonal_arrays {
    static constexpr std::string_view format_tag{"dia"};

    Shape shape;
    std::vector<T> data;
    std::vector<std::int64_t> offsets;

    /**
     * @brief Number of values stored per diagonal.
     *
     * The length is not kept when `offsets` is empty; it reads as 0 even
     * if the stored `data` was shaped [0, n].
     */
    std::size_t
    length() const
    {
      return offsets.empty() ? 0 : data.size() / offsets.size();
    }

    friend bool
    operator==(Diagonal_arrays const&, Diagonal_arrays const&) = default;
  };

} // end of namespace npzkit::data::detail
