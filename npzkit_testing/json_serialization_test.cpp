//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <cstdint>
#include <string>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... npzkit header files
//
#include <npzkit/data/json_serialization.hpp>
#include <npzkit/data/sparse_npz.hpp>

namespace npzkit::testing {

  using nlohmann::json;
  using npzkit::data::detail::Block_sparse_row_arrays;
  using npzkit::data::detail::Compressed_row_arrays;
  using npzkit::data::detail::Coordinate_arrays;
  using npzkit::data::detail::Diagonal_arrays;
  using npzkit::data::detail::Format_mismatch;
  using npzkit::data::detail::Invalid_format;
  using npzkit::data::detail::Npz_archive;
  using npzkit::data::detail::Shape;
  using npzkit::data::detail::Sparse_arrays;
  using npzkit::data::detail::describe;
  using npzkit::data::detail::sparse_arrays_from_json;
  using npzkit::data::detail::sparse_arrays_to_json;
  using npzkit::data::detail::write_sparse_npz;

  TEST_CASE("json_serialization - coordinate_to_json", "[json_serialization]")
  {
    Coordinate_arrays<double> const m{Shape{2, 3}, {1.5, 2.5}, {0, 1}, {2, 0}};
    json const expected = json::parse(R"({
      "format": "coo",
      "shape": [2, 3],
      "data": [1.5, 2.5],
      "row": [0, 1],
      "col": [2, 0]
    })");

    CHECK(json(m) == expected);
  }

  TEST_CASE("json_serialization - block_sparse_row_to_json", "[json_serialization]")
  {
    Block_sparse_row_arrays<double> const m{Shape{2, 2}, {2, 2}, {1.0, 2.0, 3.0, 4.0}, {0}, {0, 1}};
    auto const j = json(m);

    CHECK(j.at("format") == "bsr");
    CHECK(j.at("blocksize") == json::array({2, 2}));
    CHECK(j.at("indptr") == json::array({0, 1}));
  }

  TEST_CASE("json_serialization - record_from_json", "[json_serialization]")
  {
    auto const j = json::parse(R"({
      "format": "csr",
      "shape": [2, 2],
      "data": [4.0],
      "indices": [1],
      "indptr": [0, 1, 1]
    })");

    auto const m = j.get<Compressed_row_arrays<double>>();
    CHECK(m == Compressed_row_arrays<double>{Shape{2, 2}, {4.0}, {1}, {0, 1, 1}});
  }

  TEST_CASE("json_serialization - record_from_json_checks_format", "[json_serialization]")
  {
    auto const j = json(Coordinate_arrays<double>{Shape{1, 1}, {1.0}, {0}, {0}});
    CHECK_THROWS_AS(j.get<Compressed_row_arrays<double>>(), Format_mismatch);
  }

  TEST_CASE("json_serialization - variant_round_trip", "[json_serialization]")
  {
    Sparse_arrays<double> const matrix = Diagonal_arrays<double>{Shape{2, 2}, {1.0, 2.0}, {-1}};
    auto const j = sparse_arrays_to_json(matrix);

    CHECK(j.at("format") == "dia");
    CHECK(sparse_arrays_from_json(j) == matrix);
  }

  TEST_CASE("json_serialization - unknown_format", "[json_serialization]")
  {
    auto const j = json::parse(R"({"format": "lil", "shape": [1, 1]})");
    CHECK_THROWS_AS(sparse_arrays_from_json(j), Invalid_format);
  }

  TEST_CASE("json_serialization - describe_archive", "[json_serialization]")
  {
    Npz_archive npz;
    write_sparse_npz(Coordinate_arrays<double>{Shape{4, 4}, {1.0, 2.0}, {0, 3}, {1, 2}}, npz);

    auto const expected = json::parse(R"([
      {"name": "format", "descr": "|S3", "shape": [], "fortran_order": false},
      {"name": "shape", "descr": "<i8", "shape": [2], "fortran_order": false},
      {"name": "row", "descr": "<i4", "shape": [2], "fortran_order": false},
      {"name": "col", "descr": "<i4", "shape": [2], "fortran_order": false},
      {"name": "data", "descr": "<f8", "shape": [2], "fortran_order": false}
    ])");

    CHECK(describe(npz) == expected);
  }

} // end of namespace npzkit::testing
