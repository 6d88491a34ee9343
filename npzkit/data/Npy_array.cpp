#include <npzkit/data/Npy_array.hpp>

namespace npzkit::data::detail {

  Npy_array::Npy_array(Npy_header header, std::string data)
      : header_(std::move(header))
      , data_(std::move(data))
  {
    auto const count = element_count(header_.shape);
    auto const itemsize = header_.dtype.size();
    if (itemsize != 0 && count > data_.max_size() / itemsize) {
      throw Npy_format_error("array too large");
    }
    if (data_.size() != count * itemsize) {
      throw Npy_format_error(
        "expected " + std::to_string(count * itemsize) + " bytes of element data, found " +
        std::to_string(data_.size()));
    }
  }

  Npy_array
  Npy_array::parse(std::string_view bytes)
  {
    auto [header, offset] = parse_npy_header(bytes);
    return Npy_array{std::move(header), std::string(bytes.substr(offset))};
  }

  Dtype const&
  Npy_array::dtype() const { return header_.dtype; }

  std::span<std::uint64_t const>
  Npy_array::shape() const { return {header_.shape.data(), header_.shape.size()}; }

  std::size_t
  Npy_array::ndim() const { return header_.shape.size(); }

  Order
  Npy_array::order() const { return header_.order; }

  std::uint64_t
  Npy_array::size() const { return element_count(header_.shape); }

  std::vector<std::string>
  Npy_array::byte_strings() const
  {
    if (header_.dtype.kind() != 'S') {
      throw Deserialize_error(header_.dtype.descr(), "|S");
    }

    auto const width = header_.dtype.size();
    std::vector<std::string> result;
    for (std::size_t k = 0; k < size(); ++k) {
      std::string item = data_.substr(k * width, width);
      item.erase(item.find_last_not_of('\0') + 1);
      result.push_back(std::move(item));
    }
    return result;
  }

} // end of namespace npzkit::data::detail
