#include <npzkit/data/sparse_npz.hpp>

namespace npzkit::data::detail {

  namespace {

    std::vector<std::int64_t>
    read_integers(Npz_archive const& npz, std::string const& name)
    {
      auto array = fetch_array(npz, name, 1);
      auto values = widen_indices(array);
      if (!values) {
        throw Invalid_dtype(name, array.dtype().descr());
      }
      return std::move(*values);
    }

  } // end of anonymous namespace

  Npy_array
  fetch_array(Npz_archive const& npz, std::string const& name, std::size_t expected_ndim)
  {
    auto array = npz.by_name(name);
    if (!array) {
      throw Missing_array(name);
    }
    if (array->ndim() != expected_ndim) {
      throw Invalid_rank(name, expected_ndim, array->ndim());
    }
    return std::move(*array);
  }

  std::string
  read_format(Npz_archive const& npz)
  {
    auto array = npz.by_name("format");
    if (!array) {
      throw Missing_array("format");
    }
    if (array->dtype().kind() != 'S') {
      throw Invalid_dtype("format", array->dtype().descr());
    }
    auto strings = array->byte_strings();
    if (array->ndim() != 0) {
      std::string raw;
      for (auto const& item : strings) { raw += item; }
      throw Invalid_format(std::move(raw));
    }
    return std::move(strings.front());
  }

  void
  expect_format(Npz_archive const& npz, std::string_view expected)
  {
    auto format = read_format(npz);
    if (format != expected) {
      throw Format_mismatch(std::string(expected), std::move(format));
    }
  }

  Shape
  read_shape(Npz_archive const& npz, std::string const& name)
  {
    auto shape = read_integers(npz, name);
    if (shape.size() != 2) {
      throw Invalid_shape(
        name, "got " + std::to_string(shape.size()) + " elements, expected 2");
    }
    return Shape{static_cast<Shape::size_type>(shape[0]), static_cast<Shape::size_type>(shape[1])};
  }

  std::vector<std::uint64_t>
  read_indices(Npz_archive const& npz, std::string const& name)
  {
    auto values = read_integers(npz, name);
    return std::vector<std::uint64_t>(values.begin(), values.end());
  }

  std::vector<std::size_t>
  read_pointers(Npz_archive const& npz, std::string const& name)
  {
    auto values = read_integers(npz, name);
    return std::vector<std::size_t>(values.begin(), values.end());
  }

  std::vector<std::int64_t>
  read_offsets(Npz_archive const& npz, std::string const& name)
  {
    return read_integers(npz, name);
  }

  void
  write_format(Npz_archive& npz, std::string_view format)
  {
    npz.start_array("format", Dtype::bytes(format.size()), {}).push_bytes(format).finish();
  }

  void
  write_shape(Npz_archive& npz, Shape const& shape)
  {
    std::vector<Shape::size_type> const dims{shape.row(), shape.column()};
    auto const values = to_signed_indices<Shape::size_type>("shape", dims);

    npz.start_array("shape", Dtype::of<std::int64_t>(), {2}).extend(values).finish();
  }

  void
  write_indices(Npz_archive& npz, std::string const& name, std::span<std::int64_t const> values)
  {
    auto const width = select_index_width(values);
    auto builder = npz.start_array(name, index_dtype(width), {values.size()});
    if (width == Index_width::narrow) {
      for (auto value : values) {
        builder.push(static_cast<std::int32_t>(value));
      }
    } else {
      builder.extend(values);
    }
    builder.finish();
  }

} // end of namespace npzkit::data::detail
