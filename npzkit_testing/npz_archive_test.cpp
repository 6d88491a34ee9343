//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

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
#include <npzkit/data/Npz_archive.hpp>

namespace npzkit::testing {

  using npzkit::data::detail::Dtype;
  using npzkit::data::detail::Npz_archive;

  TEST_CASE("npz_archive - start_array_and_finish", "[npz_archive]")
  {
    Npz_archive npz;
    npz.start_array("row", Dtype::of<std::int32_t>(), {3})
      .extend(std::vector<std::int32_t>{0, 1, 2})
      .finish();

    REQUIRE(npz.contains("row"));
    CHECK(npz.member_names() == std::vector<std::string>{"row.npy"});

    auto array = npz.by_name("row");
    REQUIRE(array);
    CHECK(array->dtype().descr() == "<i4");
    CHECK(array->as<std::int32_t>() == std::vector<std::int32_t>{0, 1, 2});
  }

  TEST_CASE("npz_archive - absent_array", "[npz_archive]")
  {
    Npz_archive npz;
    CHECK_FALSE(npz.contains("data"));
    CHECK_FALSE(npz.by_name("data"));
    CHECK_THROWS_AS(npz.member("data.npy"), std::invalid_argument);
  }

  TEST_CASE("npz_archive - names_keep_insertion_order", "[npz_archive]")
  {
    Npz_archive npz;
    npz.start_array("shape", Dtype::of<std::int64_t>(), {1}).push(std::int64_t{4}).finish();
    npz.start_array("data", Dtype::of<double>(), {1}).push(1.0).finish();
    npz.start_array("col", Dtype::of<std::int32_t>(), {1}).push(std::int32_t{0}).finish();

    CHECK(npz.names() == std::vector<std::string>{"shape", "data", "col"});
  }

  TEST_CASE("npz_archive - rejects_duplicate_names", "[npz_archive]")
  {
    Npz_archive npz;
    npz.start_array("data", Dtype::of<double>(), {0}).finish();
    CHECK_THROWS_AS(npz.start_array("data", Dtype::of<double>(), {0}), std::invalid_argument);
    CHECK_THROWS_AS(npz.insert_member("data.npy", ""), std::invalid_argument);
  }

  TEST_CASE("npz_archive - builder_checks_element_count", "[npz_archive]")
  {
    Npz_archive npz;

    auto short_builder = npz.start_array("a", Dtype::of<std::int32_t>(), {2});
    short_builder.push(std::int32_t{1});
    CHECK_THROWS_AS(short_builder.finish(), std::invalid_argument);

    auto long_builder = npz.start_array("b", Dtype::of<std::int32_t>(), {1});
    long_builder.push(std::int32_t{1});
    CHECK_THROWS_AS(long_builder.push(std::int32_t{2}), std::invalid_argument);

    CHECK(npz.names().empty());
  }

  TEST_CASE("npz_archive - builder_checks_element_type", "[npz_archive]")
  {
    Npz_archive npz;
    auto builder = npz.start_array("data", Dtype::of<double>(), {1});
    CHECK_THROWS_AS(builder.push(1.0f), std::invalid_argument);
    CHECK_THROWS_AS(builder.push(std::int64_t{1}), std::invalid_argument);
    CHECK_THROWS_AS(builder.push_bytes("x"), std::invalid_argument);
  }

  TEST_CASE("npz_archive - builder_rejects_big_endian", "[npz_archive]")
  {
    Npz_archive npz;
    CHECK_THROWS_AS(npz.start_array("data", Dtype::parse(">f8"), {1}), std::invalid_argument);
  }

  TEST_CASE("npz_archive - unfinished_builder_adds_nothing", "[npz_archive]")
  {
    Npz_archive npz;
    {
      auto builder = npz.start_array("data", Dtype::of<double>(), {1});
      builder.push(2.0);
    }
    CHECK_FALSE(npz.contains("data"));
  }

  TEST_CASE("npz_archive - push_bytes_pads_with_nul", "[npz_archive]")
  {
    Npz_archive npz;
    npz.start_array("format", Dtype::bytes(5), {}).push_bytes("csr").finish();

    auto array = npz.by_name("format");
    REQUIRE(array);
    CHECK(array->dtype().descr() == "|S5");
    CHECK(array->ndim() == 0);
    CHECK(array->byte_strings() == std::vector<std::string>{"csr"});

    auto builder = npz.start_array("other", Dtype::bytes(2), {});
    CHECK_THROWS_AS(builder.push_bytes("abc"), std::invalid_argument);
  }

  TEST_CASE("npz_archive - copies_are_independent", "[npz_archive]")
  {
    Npz_archive original;
    original.start_array("a", Dtype::of<double>(), {0}).finish();

    Npz_archive copy = original;
    copy.start_array("b", Dtype::of<double>(), {0}).finish();

    CHECK(original.names() == std::vector<std::string>{"a"});
    CHECK(copy.names() == std::vector<std::string>{"a", "b"});

    Npz_archive moved = std::move(copy);
    CHECK(moved.names() == std::vector<std::string>{"a", "b"});
  }

} // end of namespace npzkit::testing
