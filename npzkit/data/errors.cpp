//
// ... Standard header files
//
#include <cstdio>
#include <utility>
#include <string>

//
// ... npzkit header files
//
#include <npzkit/data/errors.hpp>

namespace npzkit::data::detail {

  Missing_array::Missing_array(std::string name)
      : Npz_error("missing array '" + name + "' from sparse array")
      , name_(std::move(name))
  {}

  std::string const&
  Missing_array::name() const { return name_; }

  Invalid_rank::Invalid_rank(std::string name, std::size_t expected, std::size_t actual)
      : Npz_error("invalid ndim for '" + name + "': " + std::to_string(actual) +
                  " (expected " + std::to_string(expected) + ")")
      , name_(std::move(name))
      , expected_(expected)
      , actual_(actual)
  {}

  std::string const&
  Invalid_rank::name() const { return name_; }

  std::size_t
  Invalid_rank::expected() const { return expected_; }

  std::size_t
  Invalid_rank::actual() const { return actual_; }

  Invalid_dtype::Invalid_dtype(std::string name, std::string descr)
      : Npz_error("invalid dtype for '" + name + "' in sparse matrix: " + descr)
      , name_(std::move(name))
      , descr_(std::move(descr))
  {}

  std::string const&
  Invalid_dtype::name() const { return name_; }

  std::string const&
  Invalid_dtype::descr() const { return descr_; }

  Invalid_shape::Invalid_shape(std::string name, std::string const& detail)
      : Npz_error("invalid shape for '" + name + "': " + detail)
      , name_(std::move(name))
  {}

  std::string const&
  Invalid_shape::name() const { return name_; }

  Invalid_format::Invalid_format(std::string raw)
      : Npz_error("bad format: " + show_bytes(raw))
      , raw_(std::move(raw))
  {}

  std::string const&
  Invalid_format::raw() const { return raw_; }

  Format_mismatch::Format_mismatch(std::string expected, std::string actual)
      : Npz_error("wrong format: expected '" + expected + "', got " + show_bytes(actual))
      , expected_(std::move(expected))
      , actual_(std::move(actual))
  {}

  std::string const&
  Format_mismatch::expected() const { return expected_; }

  std::string const&
  Format_mismatch::actual() const { return actual_; }

  Unsupported_order::Unsupported_order(std::string name)
      : Npz_error("fortran order is not supported for array '" + name + "' in sparse NPZ file")
      , name_(std::move(name))
  {}

  std::string const&
  Unsupported_order::name() const { return name_; }

  Npy_format_error::Npy_format_error(std::string const& detail)
      : Npz_error("npy: " + detail)
  {}

  Deserialize_error::Deserialize_error(std::string stored, std::string requested)
      : Npz_error("cannot deserialize elements of dtype '" + stored + "' as '" + requested + "'")
      , stored_(std::move(stored))
      , requested_(std::move(requested))
  {}

  std::string const&
  Deserialize_error::stored() const { return stored_; }

  std::string const&
  Deserialize_error::requested() const { return requested_; }

  Zip_error::Zip_error(std::string const& detail)
      : Npz_error("zip: " + detail)
  {}

  std::string
  show_bytes(std::string_view bytes)
  {
    std::string result = "'";
    for (unsigned char c : bytes) {
      if (c >= 0x20 && c <= 0x7f) {
        result += static_cast<char>(c);
      } else {
        char escaped[5];
        std::snprintf(escaped, sizeof(escaped), "\\x%02X", static_cast<unsigned>(c));
        result += escaped;
      }
    }
    result += "'";
    return result;
  }

} // end of namespace npzkit::data::detail
