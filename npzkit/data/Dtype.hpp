#pragma once

//
// ... Standard header files
//
#include <bit>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

//
// ... npzkit header files
//
#include <npzkit/data/import.hpp>

namespace npzkit::data::detail {

  enum class Byte_order { little, big, not_applicable };

  Byte_order
  native_byte_order();

  template <typename T>
  struct is_complex : std::false_type {};

  template <typename T>
  struct is_complex<std::complex<T>> : std::true_type {};

  /**
   * @brief Element types with a fixed NumPy dtype: bool, the sized
   * integers, float, double and their complex counterparts.
   */
  template <typename T>
  inline constexpr bool is_element_v =
    std::is_same_v<T, bool> || std::is_integral_v<T> ||
    std::is_floating_point_v<T> || is_complex<T>::value;

  /**
   * @brief A plain (non-structured) NumPy dtype descriptor such as `<i4`.
   *
   * Supported kinds are `b` (bool), `i`, `u`, `f`, `c` and `S` (fixed
   * width byte strings).
   */
  class Dtype final {
  public:
    Dtype(Byte_order order, char kind, std::size_t size);

    /**
     * @brief Parse a descriptor string. `=` resolves to the native order.
     */
    static Dtype
    parse(std::string_view descr);

    /**
     * @brief The dtype npzkit writes for elements of type T.
     */
    template <typename T>
    static Dtype
    of()
    {
      static_assert(is_element_v<T>, "no NumPy dtype for this element type");

      char kind{};
      if constexpr (std::is_same_v<T, bool>) {
        kind = 'b';
      } else if constexpr (is_complex<T>::value) {
        kind = 'c';
      } else if constexpr (std::is_floating_point_v<T>) {
        kind = 'f';
      } else if constexpr (std::is_signed_v<T>) {
        kind = 'i';
      } else {
        kind = 'u';
      }

      auto order = sizeof(T) == 1 ? Byte_order::not_applicable : Byte_order::little;
      return Dtype{order, kind, sizeof(T)};
    }

    /**
     * @brief A fixed width byte string, `|S<n>`.
     */
    static Dtype
    bytes(std::size_t size);

    Byte_order
    byte_order() const;

    char
    kind() const;

    std::size_t
    size() const;

    std::string
    descr() const;

    /**
     * @brief True when both describe the same element type, possibly in
     * different byte orders.
     */
    bool
    same_type(Dtype const& other) const;

    /**
     * @brief True when stored elements need their bytes reversed to be
     * read natively.
     */
    bool
    needs_swap() const;

    friend bool
    operator==(Dtype const& dtype1, Dtype const& dtype2);

  private:
    Byte_order order_;
    char kind_;
    std::size_t size_;

  }; // end of class Dtype

} // end of namespace npzkit::data::detail
