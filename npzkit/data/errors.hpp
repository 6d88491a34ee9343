#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

//
// ... npzkit header files
//
#include <npzkit/data/import.hpp>

namespace npzkit::data::detail {

  /**
   * @brief Base class of every error raised for malformed or foreign
   * archive content.
   *
   * Caller contract violations (a record whose arrays disagree in length,
   * an element count that does not match a declared shape) are reported
   * with `std::logic_error` instead and never derive from this class.
   */
  class Npz_error : public runtime_error {
  public:
    using runtime_error::runtime_error;

  }; // end of class Npz_error

  class Missing_array final : public Npz_error {
  public:
    explicit Missing_array(std::string name);

    std::string const&
    name() const;

  private:
    std::string name_;

  }; // end of class Missing_array

  class Invalid_rank final : public Npz_error {
  public:
    Invalid_rank(std::string name, std::size_t expected, std::size_t actual);

    std::string const&
    name() const;

    std::size_t
    expected() const;

    std::size_t
    actual() const;

  private:
    std::string name_;
    std::size_t expected_;
    std::size_t actual_;

  }; // end of class Invalid_rank

  class Invalid_dtype final : public Npz_error {
  public:
    Invalid_dtype(std::string name, std::string descr);

    std::string const&
    name() const;

    std::string const&
    descr() const;

  private:
    std::string name_;
    std::string descr_;

  }; // end of class Invalid_dtype

  class Invalid_shape final : public Npz_error {
  public:
    Invalid_shape(std::string name, std::string const& detail);

    std::string const&
    name() const;

  private:
    std::string name_;

  }; // end of class Invalid_shape

  /**
   * @brief The `format` discriminator names none of the known encodings.
   */
  class Invalid_format final : public Npz_error {
  public:
    explicit Invalid_format(std::string raw);

    /**
     * @brief The discriminator bytes exactly as stored.
     */
    std::string const&
    raw() const;

  private:
    std::string raw_;

  }; // end of class Invalid_format

  /**
   * @brief A per-encoding reader was handed an archive of another encoding.
   */
  class Format_mismatch final : public Npz_error {
  public:
    Format_mismatch(std::string expected, std::string actual);

    std::string const&
    expected() const;

    std::string const&
    actual() const;

  private:
    std::string expected_;
    std::string actual_;

  }; // end of class Format_mismatch

  class Unsupported_order final : public Npz_error {
  public:
    explicit Unsupported_order(std::string name);

    std::string const&
    name() const;

  private:
    std::string name_;

  }; // end of class Unsupported_order

  class Npy_format_error final : public Npz_error {
  public:
    explicit Npy_format_error(std::string const& detail);

  }; // end of class Npy_format_error

  /**
   * @brief Stored elements cannot be materialized as the requested type.
   */
  class Deserialize_error final : public Npz_error {
  public:
    Deserialize_error(std::string stored, std::string requested);

    std::string const&
    stored() const;

    std::string const&
    requested() const;

  private:
    std::string stored_;
    std::string requested_;

  }; // end of class Deserialize_error

  class Zip_error final : public Npz_error {
  public:
    explicit Zip_error(std::string const& detail);

  }; // end of class Zip_error

  /**
   * @brief Render bytes for a diagnostic, quoted, with every byte outside
   * the printable ASCII range written as `\xHH`.
   */
  std::string
  show_bytes(std::string_view bytes);

} // end of namespace npzkit::data::detail
