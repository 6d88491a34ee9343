#pragma once

//
// ... Standard header files
//
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data/Npz_archive.hpp>
#include <npzkit/data/Sparse_arrays.hpp>
#include <npzkit/data/errors.hpp>

// JSON forms of the raw sparse arrays. Every object carries its "format"
// discriminator next to the same array names used inside an NPZ archive.

namespace npzkit::data::detail {

  inline void
  expect_json_format(json const& j, std::string_view expected)
  {
    auto format = j.at("format").get<std::string>();
    if (format != expected) {
      throw Format_mismatch(std::string(expected), std::move(format));
    }
  }

  // -- Coordinate_arrays<T> --

  template <typename T>
  void
  to_json(json& j, Coordinate_arrays<T> const& m) {
    j = {{"format", std::string(m.format_tag)},
         {"shape", m.shape},
         {"data", m.data},
         {"row", m.row},
         {"col", m.col}};
  }

  template <typename T>
  void
  from_json(json const& j, Coordinate_arrays<T>& m) {
    expect_json_format(j, m.format_tag);
    m.shape = j.at("shape").get<Shape>();
    m.data = j.at("data").get<std::vector<T>>();
    m.row = j.at("row").get<std::vector<std::uint64_t>>();
    m.col = j.at("col").get<std::vector<std::uint64_t>>();
  }

  // -- Compressed_row_arrays<T> --

  template <typename T>
  void
  to_json(json& j, Compressed_row_arrays<T> const& m) {
    j = {{"format", std::string(m.format_tag)},
         {"shape", m.shape},
         {"data", m.data},
         {"indices", m.indices},
         {"indptr", m.indptr}};
  }

  template <typename T>
  void
  from_json(json const& j, Compressed_row_arrays<T>& m) {
    expect_json_format(j, m.format_tag);
    m.shape = j.at("shape").get<Shape>();
    m.data = j.at("data").get<std::vector<T>>();
    m.indices = j.at("indices").get<std::vector<std::uint64_t>>();
    m.indptr = j.at("indptr").get<std::vector<std::size_t>>();
  }

  // -- Compressed_column_arrays<T> --

  template <typename T>
  void
  to_json(json& j, Compressed_column_arrays<T> const& m) {
    j = {{"format", std::string(m.format_tag)},
         {"shape", m.shape},
         {"data", m.data},
         {"indices", m.indices},
         {"indptr", m.indptr}};
  }

  template <typename T>
  void
  from_json(json const& j, Compressed_column_arrays<T>& m) {
    expect_json_format(j, m.format_tag);
    m.shape = j.at("shape").get<Shape>();
    m.data = j.at("data").get<std::vector<T>>();
    m.indices = j.at("indices").get<std::vector<std::uint64_t>>();
    m.indptr = j.at("indptr").get<std::vector<std::size_t>>();
  }

  // -- Diagonal_arrays<T> --

  template <typename T>
  void
  to_json(json& j, Diagonal_arrays<T> const& m) {
    j = {{"format", std::string(m.format_tag)},
         {"shape", m.shape},
         {"data", m.data},
         {"offsets", m.offsets}};
  }

  template <typename T>
  void
  from_json(json const& j, Diagonal_arrays<T>& m) {
    expect_json_format(j, m.format_tag);
    m.shape = j.at("shape").get<Shape>();
    m.data = j.at("data").get<std::vector<T>>();
    m.offsets = j.at("offsets").get<std::vector<std::int64_t>>();
  }

  // -- Block_sparse_row_arrays<T> --

  template <typename T>
  void
  to_json(json& j, Block_sparse_row_arrays<T> const& m) {
    j = {{"format", std::string(m.format_tag)},
         {"shape", m.shape},
         {"blocksize", m.blocksize},
         {"data", m.data},
         {"indices", m.indices},
         {"indptr", m.indptr}};
  }

  template <typename T>
  void
  from_json(json const& j, Block_sparse_row_arrays<T>& m) {
    expect_json_format(j, m.format_tag);
    m.shape = j.at("shape").get<Shape>();
    m.blocksize = j.at("blocksize").get<std::array<std::size_t, 2>>();
    m.data = j.at("data").get<std::vector<T>>();
    m.indices = j.at("indices").get<std::vector<std::uint64_t>>();
    m.indptr = j.at("indptr").get<std::vector<std::size_t>>();
  }

  // -- Sparse_arrays<T> --

  template <typename T>
  json
  sparse_arrays_to_json(Sparse_arrays<T> const& matrix) {
    return std::visit([](auto const& m) { return json(m); }, matrix);
  }

  template <typename T = config::value_type>
  Sparse_arrays<T>
  sparse_arrays_from_json(json const& j) {
    auto const format = j.at("format").get<std::string>();
    if (format == Coordinate_arrays<T>::format_tag) {
      return j.get<Coordinate_arrays<T>>();
    }
    if (format == Compressed_row_arrays<T>::format_tag) {
      return j.get<Compressed_row_arrays<T>>();
    }
    if (format == Compressed_column_arrays<T>::format_tag) {
      return j.get<Compressed_column_arrays<T>>();
    }
    if (format == Diagonal_arrays<T>::format_tag) {
      return j.get<Diagonal_arrays<T>>();
    }
    if (format == Block_sparse_row_arrays<T>::format_tag) {
      return j.get<Block_sparse_row_arrays<T>>();
    }
    throw Invalid_format(format);
  }

  // -- Npz_archive --

  /**
   * @brief Summarize the arrays of an archive: name, dtype descriptor,
   * shape and memory order of each, in archive order.
   */
  inline json
  describe(Npz_archive const& npz) {
    json result = json::array();
    for (auto const& name : npz.names()) {
      auto array = npz.by_name(name);
      auto shape = array->shape();
      result.push_back({
        {"name", name},
        {"descr", array->dtype().descr()},
        {"shape", std::vector<std::uint64_t>(shape.begin(), shape.end())},
        {"fortran_order", array->order() == Order::fortran}});
    }
    return result;
  }

} // end of namespace npzkit::data::detail
