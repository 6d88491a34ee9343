#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>

namespace npzkit::data::detail {

  enum class Order { c, fortran };

  /**
   * @brief The dictionary at the start of every `.npy` stream.
   */
  struct Npy_header {
    Dtype dtype;
    Order order;
    std::vector<std::uint64_t> shape;
  };

  /**
   * @brief Number of elements described by a shape; one for a scalar.
   *
   * Throws Npy_format_error when the product overflows.
   */
  std::uint64_t
  element_count(std::vector<std::uint64_t> const& shape);

  /**
   * @brief Format the complete preamble: magic, version, header length and
   * the header dictionary padded to a 64 byte boundary.
   *
   * Version 1.0 is written unless the dictionary exceeds 65535 bytes, in
   * which case version 2.0 is used.
   */
  std::string
  format_npy_header(Npy_header const& header);

  struct Parsed_npy_header {
    Npy_header header;
    std::size_t data_offset;
  };

  /**
   * @brief Parse the preamble of a `.npy` stream (versions 1.0, 2.0, 3.0).
   *
   * Throws Npy_format_error for a bad magic string, an unknown version, a
   * truncated header, or a dictionary that is not a plain
   * `{'descr', 'fortran_order', 'shape'}` triple.
   */
  Parsed_npy_header
  parse_npy_header(std::string_view bytes);

} // end of namespace npzkit::data::detail
