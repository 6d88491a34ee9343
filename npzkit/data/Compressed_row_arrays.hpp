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
   * @brief Raw arrays of a `scipy.sparse.csr_matrix`.
   *
   * `data` and `indices` have length nnz; `indices` holds the column of
   * each entry. `indptr` partitions them by row and typically has length
   * nrow + 1, starts at 0, ends at nnz and never decreases.
   *
   * @note None of the `indptr` properties above are checked when reading,
   * and column indices within a row need not be sorted; scipy guarantees
   * neither. Records carrying such arrays still round-trip unchanged.
   */
  template <typename T = config::value_type>
  struct Compressed_row_arrays {
    static constexpr std::string_view format_tag{"csr"};

    Shape shape;
    std::vector<T> data;
    std::vector<std::uint64_t> indices;
    std::vector<std::size_t> indptr;

    friend bool
    operator==(Compressed_row_arrays const&, Compressed_row_arrays const&) = default;
  };

} // end of namespace npzkit::data::detail
