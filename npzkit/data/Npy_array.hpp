#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/Npy_header.hpp>
#include <npzkit/data/element.hpp>
#include <npzkit/data/errors.hpp>

namespace npzkit::data::detail {

  /**
   * @brief A single parsed `.npy` array: header plus raw element bytes.
   *
   * Elements are kept in their stored byte order and only converted when
   * materialized with as<T>().
   */
  class Npy_array final {
  public:
    Npy_array(Npy_header header, std::string data);

    /**
     * @brief Parse a complete `.npy` stream.
     *
     * Throws Npy_format_error if the header is malformed or the element
     * bytes do not match the declared shape and dtype.
     */
    static Npy_array
    parse(std::string_view bytes);

    Dtype const&
    dtype() const;

    std::span<std::uint64_t const>
    shape() const;

    std::size_t
    ndim() const;

    Order
    order() const;

    /**
     * @brief Number of elements.
     */
    std::uint64_t
    size() const;

    /**
     * @brief Materialize every element as T, in storage order.
     *
     * The stored dtype must describe T exactly (same kind and width, either
     * byte order); otherwise Deserialize_error is thrown.
     */
    template <typename T>
    std::vector<T>
    as() const
    {
      auto const requested = Dtype::of<T>();
      if (!header_.dtype.same_type(requested)) {
        throw Deserialize_error(header_.dtype.descr(), requested.descr());
      }

      std::vector<T> result;
      result.reserve(static_cast<std::size_t>(size()));
      for (std::size_t k = 0; k < data_.size(); k += sizeof(T)) {
        result.push_back(load_element<T>(data_.data() + k, header_.dtype));
      }
      return result;
    }

    /**
     * @brief The bytes of each element of a byte string array, with
     * trailing NUL bytes removed as NumPy does.
     */
    std::vector<std::string>
    byte_strings() const;

  private:
    Npy_header header_;
    std::string data_;

  }; // end of class Npy_array

} // end of namespace npzkit::data::detail
