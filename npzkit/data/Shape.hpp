#pragma once

//
// ... Standard header files
//
#include <cstdint>

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data/import.hpp>

namespace npzkit::data::detail {

  /**
   * @brief A type describing a matrix shape: the number of rows and columns
   *
   * Both dimensions may be zero; an empty matrix is a valid sparse matrix.
   */
  class Shape final {
  public:
    using size_type = std::uint64_t;

    Shape(size_type row, size_type column);
    Shape(const Shape& input) = default;
    Shape&
    operator=(const Shape& input) = default;
    Shape(Shape&& input) = default;
    Shape&
    operator=(Shape&& input) = default;
    ~Shape() = default;
    Shape() = default;

    size_type
    row() const;

    size_type
    column() const;

    friend bool
    operator==(const Shape& shape1, const Shape& shape2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Shape

  void
  to_json(json& j, Shape const& shape);

  void
  from_json(const json& j, Shape& shape);

} // namespace npzkit::data::detail
