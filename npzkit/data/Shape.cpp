#include <npzkit/data/Shape.hpp>


namespace npzkit::data::detail
{

  Shape::Shape(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {}

  Shape::size_type
  Shape::row() const { return row_; }

  Shape::size_type
  Shape::column() const { return column_; }

  bool
  operator==(const Shape& shape1, const Shape& shape2){
    return shape1.row_ == shape2.row_ && shape1.column_ == shape2.column_;
  }

  void
  to_json(json& j, Shape const& shape)
  {
    j = {shape.row(), shape.column()};
  }

  void
  from_json(const json& j, Shape& shape){
    if (!j.is_array() || j.size() != 2) {
      throw runtime_error("shape: expected an array of two dimensions");
    }
    shape = Shape(j[0].get<Shape::size_type>(), j[1].get<Shape::size_type>());
  }

} // end of namespace npzkit::data::detail
