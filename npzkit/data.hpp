#pragma once

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/Npy_array.hpp>
#include <npzkit/data/Npz_archive.hpp>
#include <npzkit/data/Shape.hpp>
#include <npzkit/data/Sparse_arrays.hpp>
#include <npzkit/data/errors.hpp>
#include <npzkit/data/json_serialization.hpp>
#include <npzkit/data/sparse_npz.hpp>
#include <npzkit/data/zip.hpp>

namespace npzkit::data {
  using ::npzkit::data::detail::Shape;
  using ::npzkit::data::detail::Dtype;
  using ::npzkit::data::detail::Order;
  using ::npzkit::data::detail::Npy_array;
  using ::npzkit::data::detail::Npz_archive;

  using ::npzkit::data::detail::Coordinate_arrays;
  using ::npzkit::data::detail::Compressed_row_arrays;
  using ::npzkit::data::detail::Compressed_column_arrays;
  using ::npzkit::data::detail::Diagonal_arrays;
  using ::npzkit::data::detail::Block_sparse_row_arrays;
  using ::npzkit::data::detail::Sparse_arrays;
  using ::npzkit::data::detail::format_of;

  using ::npzkit::data::detail::Npz_error;
  using ::npzkit::data::detail::Missing_array;
  using ::npzkit::data::detail::Invalid_rank;
  using ::npzkit::data::detail::Invalid_dtype;
  using ::npzkit::data::detail::Invalid_shape;
  using ::npzkit::data::detail::Invalid_format;
  using ::npzkit::data::detail::Format_mismatch;
  using ::npzkit::data::detail::Unsupported_order;
  using ::npzkit::data::detail::Npy_format_error;
  using ::npzkit::data::detail::Deserialize_error;
  using ::npzkit::data::detail::Zip_error;

  using ::npzkit::data::detail::read_coordinate;
  using ::npzkit::data::detail::read_compressed_row;
  using ::npzkit::data::detail::read_compressed_column;
  using ::npzkit::data::detail::read_diagonal;
  using ::npzkit::data::detail::read_block_sparse_row;
  using ::npzkit::data::detail::read_sparse_npz;
  using ::npzkit::data::detail::write_sparse_npz;
  using ::npzkit::data::detail::load_sparse_npz;
  using ::npzkit::data::detail::save_sparse_npz;

  using ::npzkit::data::detail::read_npz;
  using ::npzkit::data::detail::write_npz;

  using ::npzkit::data::detail::sparse_arrays_to_json;
  using ::npzkit::data::detail::sparse_arrays_from_json;
  using ::npzkit::data::detail::describe;

} // end of namespace npzkit::data
