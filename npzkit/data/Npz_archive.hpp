#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/Npy_array.hpp>
#include <npzkit/data/Npy_builder.hpp>

namespace npzkit::data::detail {

  /**
   * @brief An NPZ archive held in memory: an ordered collection of named
   * `.npy` members.
   *
   * Arrays are addressed by name without the `.npy` suffix, as
   * `numpy.load` does. Members keep their insertion order, which is the
   * order they are written to disk.
   *
   * @note This class uses the PImpl idiom for ABI stability.
   *
   * @see read_npz, write_npz
   */
  class Npz_archive final {
  public:
    Npz_archive();

    Npz_archive(Npz_archive const& input);
    Npz_archive(Npz_archive&& input);

    Npz_archive&
    operator=(Npz_archive const& input);

    Npz_archive&
    operator=(Npz_archive&& input);

    ~Npz_archive();

    /**
     * @brief Fetch and parse an array, or nothing when it is absent.
     *
     * Throws Npy_format_error when the member exists but is not a valid
     * `.npy` stream.
     */
    std::optional<Npy_array>
    by_name(std::string_view name) const;

    bool
    contains(std::string_view name) const;

    /**
     * @brief Array names in insertion order.
     */
    std::vector<std::string>
    names() const;

    /**
     * @brief Begin a new array; the elements are committed by
     * Npy_builder::finish.
     *
     * Throws std::invalid_argument if an array of that name exists.
     */
    Npy_builder
    start_array(std::string name, Dtype dtype, std::vector<std::uint64_t> shape);

    // -- Raw members, keyed by the full member name ("shape.npy") --

    void
    insert_member(std::string member_name, std::string bytes);

    std::vector<std::string>
    member_names() const;

    std::string const&
    member(std::string_view member_name) const;

  private:
    class Impl;
    Impl* pimpl;

  }; // end of class Npz_archive

} // end of namespace npzkit::data::detail
