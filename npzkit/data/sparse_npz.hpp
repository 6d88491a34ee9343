#pragma once

//
// ... Standard header files
//
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data/Npy_array.hpp>
#include <npzkit/data/Npz_archive.hpp>
#include <npzkit/data/Shape.hpp>
#include <npzkit/data/Sparse_arrays.hpp>
#include <npzkit/data/errors.hpp>
#include <npzkit/data/index_width.hpp>
#include <npzkit/data/zip.hpp>

namespace npzkit::data::detail {

  // -- Reading helpers --

  /**
   * @brief Fetch an array and check its rank.
   *
   * Throws Missing_array or Invalid_rank.
   */
  Npy_array
  fetch_array(Npz_archive const& npz, std::string const& name, std::size_t expected_ndim);

  /**
   * @brief The raw bytes of the zero-dimensional `format` array.
   *
   * A `format` of any other rank is reported as Invalid_format.
   */
  std::string
  read_format(Npz_archive const& npz);

  /**
   * @brief Throws Format_mismatch unless `format` equals the expected tag.
   */
  void
  expect_format(Npz_archive const& npz, std::string_view expected);

  Shape
  read_shape(Npz_archive const& npz, std::string const& name);

  /**
   * @brief Read an index array stored as int32 or int64.
   *
   * Values are assumed non-negative and are not checked.
   */
  std::vector<std::uint64_t>
  read_indices(Npz_archive const& npz, std::string const& name);

  std::vector<std::size_t>
  read_pointers(Npz_archive const& npz, std::string const& name);

  std::vector<std::int64_t>
  read_offsets(Npz_archive const& npz, std::string const& name);

  template <typename T>
  std::pair<std::vector<T>, std::vector<std::uint64_t>>
  read_data(Npz_archive const& npz, std::string const& name, std::size_t expected_ndim)
  {
    auto array = fetch_array(npz, name, expected_ndim);
    if (expected_ndim > 1 && array.order() != Order::c) {
      throw Unsupported_order(name);
    }
    auto shape = array.shape();
    return {array.as<T>(), std::vector<std::uint64_t>(shape.begin(), shape.end())};
  }

  // -- Writing helpers --

  void
  write_format(Npz_archive& npz, std::string_view format);

  void
  write_shape(Npz_archive& npz, Shape const& shape);

  /**
   * @brief Write an index or offset array as `<i4` when every value fits,
   * otherwise as `<i8`.
   */
  void
  write_indices(Npz_archive& npz, std::string const& name, std::span<std::int64_t const> values);

  template <typename T>
  void
  write_data(Npz_archive& npz, std::vector<T> const& data, std::vector<std::uint64_t> shape)
  {
    npz.start_array("data", Dtype::of<T>(), std::move(shape)).extend(data).finish();
  }

  // -- Per-format readers --

  /**
   * @brief Read a `coo_matrix` saved by `scipy.sparse.save_npz`.
   */
  template <typename T = config::value_type>
  Coordinate_arrays<T>
  read_coordinate(Npz_archive const& npz)
  {
    expect_format(npz, Coordinate_arrays<T>::format_tag);
    auto shape = read_shape(npz, "shape");
    auto row = read_indices(npz, "row");
    auto col = read_indices(npz, "col");
    auto [data, data_shape] = read_data<T>(npz, "data", 1);
    return Coordinate_arrays<T>{shape, std::move(data), std::move(row), std::move(col)};
  }

  /**
   * @brief Read a `csr_matrix` saved by `scipy.sparse.save_npz`.
   */
  template <typename T = config::value_type>
  Compressed_row_arrays<T>
  read_compressed_row(Npz_archive const& npz)
  {
    expect_format(npz, Compressed_row_arrays<T>::format_tag);
    auto shape = read_shape(npz, "shape");
    auto indices = read_indices(npz, "indices");
    auto indptr = read_pointers(npz, "indptr");
    auto [data, data_shape] = read_data<T>(npz, "data", 1);
    return Compressed_row_arrays<T>{shape, std::move(data), std::move(indices), std::move(indptr)};
  }

  /**
   * @brief Read a `csc_matrix` saved by `scipy.sparse.save_npz`.
   */
  template <typename T = config::value_type>
  Compressed_column_arrays<T>
  read_compressed_column(Npz_archive const& npz)
  {
    expect_format(npz, Compressed_column_arrays<T>::format_tag);
    auto shape = read_shape(npz, "shape");
    auto indices = read_indices(npz, "indices");
    auto indptr = read_pointers(npz, "indptr");
    auto [data, data_shape] = read_data<T>(npz, "data", 1);
    return Compressed_column_arrays<T>{
      shape, std::move(data), std::move(indices), std::move(indptr)};
  }

  /**
   * @brief Read a `dia_matrix` saved by `scipy.sparse.save_npz`.
   *
   * The diagonal length is implied by the [ndiag, length] shape of `data`.
   */
  template <typename T = config::value_type>
  Diagonal_arrays<T>
  read_diagonal(Npz_archive const& npz)
  {
    expect_format(npz, Diagonal_arrays<T>::format_tag);
    auto shape = read_shape(npz, "shape");
    auto offsets = read_offsets(npz, "offsets");
    auto [data, data_shape] = read_data<T>(npz, "data", 2);
    return Diagonal_arrays<T>{shape, std::move(data), std::move(offsets)};
  }

  /**
   * @brief Read a `bsr_matrix` saved by `scipy.sparse.save_npz`.
   *
   * The block size is taken from the [nnzb, rows, cols] shape of `data`.
   */
  template <typename T = config::value_type>
  Block_sparse_row_arrays<T>
  read_block_sparse_row(Npz_archive const& npz)
  {
    expect_format(npz, Block_sparse_row_arrays<T>::format_tag);
    auto shape = read_shape(npz, "shape");
    auto indices = read_indices(npz, "indices");
    auto indptr = read_pointers(npz, "indptr");
    auto [data, data_shape] = read_data<T>(npz, "data", 3);
    std::array<std::size_t, 2> blocksize{
      static_cast<std::size_t>(data_shape[1]), static_cast<std::size_t>(data_shape[2])};
    return Block_sparse_row_arrays<T>{
      shape, blocksize, std::move(data), std::move(indices), std::move(indptr)};
  }

  /**
   * @brief Read a sparse matrix saved by `scipy.sparse.save_npz`, in
   * whichever format its `format` array names.
   *
   * Throws Invalid_format for an unknown discriminator.
   */
  template <typename T = config::value_type>
  Sparse_arrays<T>
  read_sparse_npz(Npz_archive const& npz)
  {
    auto const format = read_format(npz);
    if (format == Coordinate_arrays<T>::format_tag) { return read_coordinate<T>(npz); }
    if (format == Compressed_row_arrays<T>::format_tag) { return read_compressed_row<T>(npz); }
    if (format == Compressed_column_arrays<T>::format_tag) {
      return read_compressed_column<T>(npz);
    }
    if (format == Diagonal_arrays<T>::format_tag) { return read_diagonal<T>(npz); }
    if (format == Block_sparse_row_arrays<T>::format_tag) {
      return read_block_sparse_row<T>(npz);
    }
    throw Invalid_format(format);
  }

  // -- Per-format writers --

  /**
   * @brief Write a coordinate matrix the way `scipy.sparse.save_npz` does.
   *
   * Array lengths are written as given and not cross-checked.
   */
  template <typename T>
  void
  write_sparse_npz(Coordinate_arrays<T> const& m, Npz_archive& npz)
  {
    auto row = to_signed_indices<std::uint64_t>("row", m.row);
    auto col = to_signed_indices<std::uint64_t>("col", m.col);

    write_format(npz, m.format_tag);
    write_shape(npz, m.shape);
    write_indices(npz, "row", row);
    write_indices(npz, "col", col);
    write_data(npz, m.data, {m.data.size()});
  }

  template <typename T>
  void
  write_sparse_npz(Compressed_row_arrays<T> const& m, Npz_archive& npz)
  {
    auto indices = to_signed_indices<std::uint64_t>("indices", m.indices);
    auto indptr = to_signed_indices<std::size_t>("indptr", m.indptr);

    write_format(npz, m.format_tag);
    write_shape(npz, m.shape);
    write_indices(npz, "indices", indices);
    write_indices(npz, "indptr", indptr);
    write_data(npz, m.data, {m.data.size()});
  }

  template <typename T>
  void
  write_sparse_npz(Compressed_column_arrays<T> const& m, Npz_archive& npz)
  {
    auto indices = to_signed_indices<std::uint64_t>("indices", m.indices);
    auto indptr = to_signed_indices<std::size_t>("indptr", m.indptr);

    write_format(npz, m.format_tag);
    write_shape(npz, m.shape);
    write_indices(npz, "indices", indices);
    write_indices(npz, "indptr", indptr);
    write_data(npz, m.data, {m.data.size()});
  }

  /**
   * @brief Write a diagonal matrix; `data` is written with shape
   * [offsets.size(), length].
   *
   * Throws std::invalid_argument, before anything is written, if
   * `data.size()` is not a multiple of `offsets.size()`.
   */
  template <typename T>
  void
  write_sparse_npz(Diagonal_arrays<T> const& m, Npz_archive& npz)
  {
    auto const ndiag = m.offsets.size();
    if (ndiag == 0 ? !m.data.empty() : m.data.size() % ndiag != 0) {
      throw std::invalid_argument(
        "dia: " + std::to_string(m.data.size()) + " values do not fill " +
        std::to_string(ndiag) + " diagonals");
    }

    write_format(npz, m.format_tag);
    write_shape(npz, m.shape);
    write_indices(npz, "offsets", m.offsets);
    write_data(npz, m.data, {ndiag, m.length()});
  }

  /**
   * @brief Write a block sparse row matrix; `data` is written with shape
   * [indices.size(), blocksize[0], blocksize[1]].
   *
   * Throws std::invalid_argument, before anything is written, if
   * `data.size()` differs from `indices.size() * blocksize[0] * blocksize[1]`.
   */
  template <typename T>
  void
  write_sparse_npz(Block_sparse_row_arrays<T> const& m, Npz_archive& npz)
  {
    auto const nnzb = m.indices.size();
    auto const [block_rows, block_cols] = m.blocksize;
    if (m.data.size() != nnzb * block_rows * block_cols) {
      throw std::invalid_argument(
        "bsr: " + std::to_string(m.data.size()) + " values do not fill " +
        std::to_string(nnzb) + " blocks of " + std::to_string(block_rows) + "x" +
        std::to_string(block_cols));
    }

    auto indices = to_signed_indices<std::uint64_t>("indices", m.indices);
    auto indptr = to_signed_indices<std::size_t>("indptr", m.indptr);

    write_format(npz, m.format_tag);
    write_shape(npz, m.shape);
    write_indices(npz, "indices", indices);
    write_indices(npz, "indptr", indptr);
    write_data(npz, m.data, {nnzb, block_rows, block_cols});
  }

  /**
   * @brief Write a sparse matrix like `scipy.sparse.save_npz`: `format`,
   * `shape`, the index arrays, then `data`.
   */
  template <typename T>
  void
  write_sparse_npz(Sparse_arrays<T> const& matrix, Npz_archive& npz)
  {
    std::visit([&](auto const& m) { write_sparse_npz(m, npz); }, matrix);
  }

  // -- Files --

  template <typename T = config::value_type>
  Sparse_arrays<T>
  load_sparse_npz(std::filesystem::path const& path)
  {
    return read_sparse_npz<T>(read_npz(path));
  }

  template <typename Matrix>
  void
  save_sparse_npz(std::filesystem::path const& path, Matrix const& matrix)
  {
    Npz_archive npz;
    write_sparse_npz(matrix, npz);
    write_npz(path, npz);
  }

} // end of namespace npzkit::data::detail
