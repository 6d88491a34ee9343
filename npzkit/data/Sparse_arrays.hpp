#pragma once

//
// ... Standard header files
//
#include <string_view>
#include <variant>

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data/Block_sparse_row_arrays.hpp>
#include <npzkit/data/Compressed_column_arrays.hpp>
#include <npzkit/data/Compressed_row_arrays.hpp>
#include <npzkit/data/Coordinate_arrays.hpp>
#include <npzkit/data/Diagonal_arrays.hpp>

namespace npzkit::data::detail {

  /**
   * @brief A scipy sparse matrix in any of the five formats `save_npz`
   * writes.
   */
  template <typename T = config::value_type>
  using Sparse_arrays = std::variant<
    Coordinate_arrays<T>,
    Compressed_row_arrays<T>,
    Compressed_column_arrays<T>,
    Diagonal_arrays<T>,
    Block_sparse_row_arrays<T>>;

  /**
   * @brief The `format` discriminator of the held record.
   */
  template <typename T>
  std::string_view
  format_of(Sparse_arrays<T> const& matrix)
  {
    return std::visit([](auto const& m) { return m.format_tag; }, matrix);
  }

} // end of namespace npzkit::data::detail
