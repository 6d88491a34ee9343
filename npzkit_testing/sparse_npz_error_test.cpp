//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

//
// ... Standard header files
//
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Npy_header.hpp>
#include <npzkit/data/errors.hpp>
#include <npzkit/data/sparse_npz.hpp>

namespace npzkit::testing {

  using npzkit::data::detail::Block_sparse_row_arrays;
  using npzkit::data::detail::Coordinate_arrays;
  using npzkit::data::detail::Deserialize_error;
  using npzkit::data::detail::Diagonal_arrays;
  using npzkit::data::detail::Dtype;
  using npzkit::data::detail::Format_mismatch;
  using npzkit::data::detail::Invalid_dtype;
  using npzkit::data::detail::Invalid_format;
  using npzkit::data::detail::Invalid_rank;
  using npzkit::data::detail::Invalid_shape;
  using npzkit::data::detail::Missing_array;
  using npzkit::data::detail::Npy_header;
  using npzkit::data::detail::Npz_archive;
  using npzkit::data::detail::Npz_error;
  using npzkit::data::detail::Order;
  using npzkit::data::detail::Shape;
  using npzkit::data::detail::Unsupported_order;
  using npzkit::data::detail::format_npy_header;
  using npzkit::data::detail::read_coordinate;
  using npzkit::data::detail::read_diagonal;
  using npzkit::data::detail::read_sparse_npz;
  using npzkit::data::detail::store_element;
  using npzkit::data::detail::write_sparse_npz;

  using Catch::Matchers::ContainsSubstring;

  namespace {

    void
    put_format(Npz_archive& npz, std::string const& format)
    {
      npz.start_array("format", Dtype::bytes(format.size()), {}).push_bytes(format).finish();
    }

    template <typename I>
    void
    put_array(Npz_archive& npz,
              std::string const& name,
              std::vector<std::uint64_t> shape,
              std::vector<I> const& values)
    {
      npz.start_array(name, Dtype::of<I>(), std::move(shape)).extend(values).finish();
    }

    // A coordinate archive with a single entry; `skip` names an array to leave out.
    Npz_archive
    coordinate_archive(std::string const& skip = "")
    {
      Npz_archive npz;
      if (skip != "format") { put_format(npz, "coo"); }
      if (skip != "shape") { put_array<std::int64_t>(npz, "shape", {2}, {2, 2}); }
      if (skip != "row") { put_array<std::int32_t>(npz, "row", {1}, {0}); }
      if (skip != "col") { put_array<std::int32_t>(npz, "col", {1}, {1}); }
      if (skip != "data") { put_array<double>(npz, "data", {1}, {1.0}); }
      return npz;
    }

  } // end of anonymous namespace

  TEST_CASE("sparse_npz_error - missing_array", "[sparse_npz_error]")
  {
    for (std::string name : {"format", "shape", "row", "col", "data"}) {
      auto const npz = coordinate_archive(name);
      try {
        read_coordinate(npz);
        FAIL("expected Missing_array for " << name);
      } catch (Missing_array const& error) {
        CHECK(error.name() == name);
        CHECK_THAT(error.what(), ContainsSubstring("'" + name + "'"));
      }
    }
  }

  TEST_CASE("sparse_npz_error - shape_with_three_elements", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "coo");
    put_array<std::int64_t>(npz, "shape", {3}, {2, 2, 2});
    CHECK_THROWS_AS(read_coordinate(npz), Invalid_shape);
  }

  TEST_CASE("sparse_npz_error - two_dimensional_row", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "coo");
    put_array<std::int64_t>(npz, "shape", {2}, {2, 2});
    put_array<std::int32_t>(npz, "row", {1, 1}, {0});

    try {
      read_coordinate(npz);
      FAIL("expected Invalid_rank");
    } catch (Invalid_rank const& error) {
      CHECK(error.name() == "row");
      CHECK(error.expected() == 1u);
      CHECK(error.actual() == 2u);
    }
  }

  TEST_CASE("sparse_npz_error - format_with_rank_one", "[sparse_npz_error]")
  {
    Npz_archive npz;
    npz.start_array("format", Dtype::bytes(3), {1}).push_bytes("coo").finish();

    try {
      read_sparse_npz(npz);
      FAIL("expected Invalid_format");
    } catch (Invalid_format const& error) {
      CHECK(error.raw() == "coo");
    }
  }

  TEST_CASE("sparse_npz_error - format_not_bytes", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_array<std::int32_t>(npz, "format", {}, {1});
    CHECK_THROWS_AS(read_sparse_npz(npz), Invalid_dtype);
  }

  TEST_CASE("sparse_npz_error - unknown_format", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "xyz");

    try {
      read_sparse_npz(npz);
      FAIL("expected Invalid_format");
    } catch (Invalid_format const& error) {
      CHECK(error.raw() == "xyz");
      CHECK_THAT(error.what(), ContainsSubstring("'xyz'"));
    }
  }

  TEST_CASE("sparse_npz_error - unprintable_format_is_escaped", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, std::string("\x01" "ab\xFF", 4));

    try {
      read_sparse_npz(npz);
      FAIL("expected Invalid_format");
    } catch (Invalid_format const& error) {
      CHECK(error.raw() == std::string("\x01" "ab\xFF", 4));
      CHECK_THAT(error.what(), ContainsSubstring("\\x01ab\\xFF"));
    }
  }

  TEST_CASE("sparse_npz_error - format_mismatch", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "csr");

    try {
      read_coordinate(npz);
      FAIL("expected Format_mismatch");
    } catch (Format_mismatch const& error) {
      CHECK(error.expected() == "coo");
      CHECK(error.actual() == "csr");
    }
  }

  TEST_CASE("sparse_npz_error - floating_point_indices", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "coo");
    put_array<std::int64_t>(npz, "shape", {2}, {2, 2});
    put_array<double>(npz, "row", {1}, {0.0});

    try {
      read_coordinate(npz);
      FAIL("expected Invalid_dtype");
    } catch (Invalid_dtype const& error) {
      CHECK(error.name() == "row");
      CHECK(error.descr() == "<f8");
    }
  }

  TEST_CASE("sparse_npz_error - data_of_other_type", "[sparse_npz_error]")
  {
    auto const npz = coordinate_archive();
    CHECK_THROWS_AS(read_coordinate<float>(npz), Deserialize_error);
    CHECK_THROWS_AS(read_coordinate<std::int64_t>(npz), Deserialize_error);
  }

  TEST_CASE("sparse_npz_error - fortran_ordered_diagonal_data", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "dia");
    put_array<std::int64_t>(npz, "shape", {2}, {2, 2});
    put_array<std::int32_t>(npz, "offsets", {2}, {0, 1});

    auto data = format_npy_header(Npy_header{Dtype::of<double>(), Order::fortran, {2, 2}});
    for (double value : {1.0, 2.0, 3.0, 4.0}) { store_element(data, value); }
    npz.insert_member("data.npy", data);

    CHECK_THROWS_AS(read_diagonal(npz), Unsupported_order);
  }

  TEST_CASE("sparse_npz_error - decode_errors_share_a_base", "[sparse_npz_error]")
  {
    Npz_archive npz;
    put_format(npz, "xyz");
    CHECK_THROWS_AS(read_sparse_npz(npz), Npz_error);
  }

  TEST_CASE("sparse_npz_error - diagonal_length_mismatch", "[sparse_npz_error]")
  {
    Diagonal_arrays<double> const uneven{Shape{3, 3}, {1.0, 2.0, 3.0, 4.0, 5.0}, {0, 1}};
    Npz_archive npz;

    CHECK_THROWS_AS(write_sparse_npz(uneven, npz), std::invalid_argument);
    CHECK(npz.names().empty());

    Diagonal_arrays<double> const orphan_data{Shape{3, 3}, {1.0}, {}};
    CHECK_THROWS_AS(write_sparse_npz(orphan_data, npz), std::invalid_argument);
    CHECK(npz.names().empty());
  }

  TEST_CASE("sparse_npz_error - block_length_mismatch", "[sparse_npz_error]")
  {
    Block_sparse_row_arrays<double> const short_data{
      Shape{4, 4}, {2, 2}, {1.0, 2.0, 3.0}, {0}, {0, 1, 1}};
    Npz_archive npz;

    CHECK_THROWS_AS(write_sparse_npz(short_data, npz), std::invalid_argument);
    CHECK(npz.names().empty());
  }

  TEST_CASE("sparse_npz_error - contract_violations_are_not_decode_errors", "[sparse_npz_error]")
  {
    Block_sparse_row_arrays<double> const short_data{
      Shape{4, 4}, {2, 2}, {1.0}, {0}, {0, 1, 1}};
    Npz_archive npz;

    try {
      write_sparse_npz(short_data, npz);
      FAIL("expected std::invalid_argument");
    } catch (Npz_error const&) {
      FAIL("contract violation reported as a decode error");
    } catch (std::invalid_argument const&) {
      SUCCEED();
    }
  }

  TEST_CASE("sparse_npz_error - index_beyond_int64", "[sparse_npz_error]")
  {
    Coordinate_arrays<double> const huge{
      Shape{2, 2}, {1.0}, {9223372036854775808ULL}, {0}};
    Npz_archive npz;
    CHECK_THROWS_AS(write_sparse_npz(huge, npz), std::invalid_argument);
    CHECK(npz.names().empty());
  }

} // end of namespace npzkit::testing
