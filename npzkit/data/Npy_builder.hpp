#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <string>
#include <string_view>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/Npy_header.hpp>
#include <npzkit/data/element.hpp>

namespace npzkit::data::detail {

  class Npz_archive;

  /**
   * @brief Sink for the elements of one new array, in row-major order.
   *
   * Exactly as many elements as the declared shape holds must be pushed
   * before finish(); pushing an element of the wrong type, too many
   * elements, or finishing early throws std::invalid_argument. An
   * unfinished builder adds nothing to the archive.
   */
  class Npy_builder final {
  public:
    Npy_builder(Npz_archive& archive, std::string name, Npy_header const& header);

    Npy_builder(Npy_builder const&) = delete;
    Npy_builder&
    operator=(Npy_builder const&) = delete;
    Npy_builder(Npy_builder&&) = default;
    Npy_builder&
    operator=(Npy_builder&&) = default;
    ~Npy_builder() = default;

    template <typename T>
    Npy_builder&
    push(T value)
    {
      check_element(Dtype::of<T>());
      store_element(bytes_, value);
      ++count_;
      return *this;
    }

    template <typename Range>
    Npy_builder&
    extend(Range const& values)
    {
      for (auto const& value : values) { push(value); }
      return *this;
    }

    /**
     * @brief Push one element of a byte string array, NUL padded to the
     * dtype width.
     */
    Npy_builder&
    push_bytes(std::string_view value);

    void
    finish();

  private:
    void
    check_element(Dtype const& dtype) const;

    Npz_archive* archive_;
    std::string name_;
    Dtype dtype_;
    std::uint64_t expected_;
    std::uint64_t count_{};
    std::string bytes_;

  }; // end of class Npy_builder

} // end of namespace npzkit::data::detail
