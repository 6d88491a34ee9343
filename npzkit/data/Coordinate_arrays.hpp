#pragma once

//
// ... Standard header files
//
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
   * @brief Raw arrays of a `scipy.sparse.coo_matrix`.
   *
   * `data`, `row` and `col` all have length nnz. Duplicate coordinates are
   * allowed and are summed by scipy.
   */
  template <typename T = config::value_type>
  struct Coordinate_arrays {
    static constexpr std::string_view format_tag{"coo"};

    Shape shape;
    std::vector<T> data;
    std::vector<std::uint64_t> row;
    std::vector<std::uint64_t> col;

    friend bool
    operator==(Coordinate_arrays const&, Coordinate_arrays const&) = default;
  };

} // end of namespace npzkit::data::detail
