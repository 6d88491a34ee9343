#pragma once

//
// ... Standard header files
//
#include <array>
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
   * @brief Raw arrays of a `scipy.sparse.bsr_matrix`.
   *
   * `data` holds a C-ordered block of shape
   * [indices.size(), blocksize[0], blocksize[1]], the dense blocks one after
   * another. `indices` gives the supercolumn of each block and `indptr`
   * (typically of length nrow / blocksize[0] + 1) partitions the blocks by
   * superrow.
   *
   * `shape` should be divisible by `blocksize`; this is not checked when
   * reading. The caveats of Compressed_row_arrays about unsorted indices
   * and unchecked `indptr` apply here too.
   */
  template <typename T = config::value_type>
  struct Block_sparse_row_arrays {
    static constexpr std::string_view format_tag{"bsr"};

    Shape shape;
    std::array<std::size_t, 2> blocksize{};
    std::vector<T> data;
    std::vector<std::uint64_t> indices;
    std::vector<std::size_t> indptr;

    friend bool
    operator==(Block_sparse_row_arrays const&, Block_sparse_row_arrays const&) = default;
  };

} // end of namespace npzkit::data::detail
