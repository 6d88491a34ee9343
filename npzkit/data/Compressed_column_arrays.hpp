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
   * @brief Raw arrays of a `scipy.sparse.csc_matrix`.
   *
   * As Compressed_row_arrays with the roles of rows and columns exchanged:
   * `indices` holds the row of each entry and `indptr` (typically of length
   * ncol + 1) partitions the entries by column. The same caveats about
   * unsorted indices and unchecked `indptr` apply.
   */
  template <typename T = config::value_type>
  struct Compressed_column_arrays {
    static constexpr std::string_view format_tag{"csc"};

    Shape shape;
    std::vector<T> data;
    std::vector<std::uint64_t> indices;
    std::vector<std::size_t> indptr;

    friend bool
    operator==(Compressed_column_arrays const&, Compressed_column_arrays const&) = default;
  };

} // end of namespace npzkit::data::detail
