//
// ... Standard header files
//
#include <bit>
#include <charconv>
#include <string>

//
// ... npzkit header files
//
#include <npzkit/data/Dtype.hpp>
#include <npzkit/data/errors.hpp>

namespace npzkit::data::detail {

  namespace {

    bool
    valid_size(char kind, std::size_t size)
    {
      switch (kind) {
      case 'b':
        return size == 1;
      case 'i':
      case 'u':
        return size == 1 || size == 2 || size == 4 || size == 8;
      case 'f':
        return size == 2 || size == 4 || size == 8 || size == 16;
      case 'c':
        return size == 8 || size == 16 || size == 32;
      case 'S':
        return true;
      default:
        return false;
      }
    }

  } // end of anonymous namespace

  Byte_order
  native_byte_order()
  {
    return std::endian::native == std::endian::little ? Byte_order::little : Byte_order::big;
  }

  Dtype::Dtype(Byte_order order, char kind, std::size_t size)
      : order_(order)
      , kind_(kind)
      , size_(size)
  {
    if (!valid_size(kind_, size_)) {
      throw std::invalid_argument(
        "dtype: invalid kind/size combination: " + std::string(1, kind_) + std::to_string(size_));
    }
  }

  Dtype
  Dtype::parse(std::string_view descr)
  {
    if (descr.empty()) {
      throw Npy_format_error("empty dtype descriptor");
    }

    auto order = Byte_order::not_applicable;
    auto rest = descr;
    switch (rest.front()) {
    case '<':
      order = Byte_order::little;
      rest.remove_prefix(1);
      break;
    case '>':
      order = Byte_order::big;
      rest.remove_prefix(1);
      break;
    case '=':
      order = native_byte_order();
      rest.remove_prefix(1);
      break;
    case '|':
      rest.remove_prefix(1);
      break;
    default:
      break;
    }

    if (rest.size() < 2) {
      throw Npy_format_error("invalid dtype descriptor: '" + std::string(descr) + "'");
    }

    char kind = rest.front();
    rest.remove_prefix(1);

    std::size_t size{};
    auto [end, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), size);
    if (ec != std::errc{} || end != rest.data() + rest.size()) {
      throw Npy_format_error("invalid dtype descriptor: '" + std::string(descr) + "'");
    }

    if (!valid_size(kind, size)) {
      throw Npy_format_error("unsupported dtype descriptor: '" + std::string(descr) + "'");
    }

    // A single byte has no order; numpy writes '|' for it.
    if (size == 1 || kind == 'S') {
      order = Byte_order::not_applicable;
    } else if (order == Byte_order::not_applicable) {
      throw Npy_format_error("dtype descriptor lacks a byte order: '" + std::string(descr) + "'");
    }

    return Dtype{order, kind, size};
  }

  Dtype
  Dtype::bytes(std::size_t size)
  {
    return Dtype{Byte_order::not_applicable, 'S', size};
  }

  Byte_order
  Dtype::byte_order() const { return order_; }

  char
  Dtype::kind() const { return kind_; }

  std::size_t
  Dtype::size() const { return size_; }

  std::string
  Dtype::descr() const
  {
    std::string result;
    switch (order_) {
    case Byte_order::little:
      result += '<';
      break;
    case Byte_order::big:
      result += '>';
      break;
    case Byte_order::not_applicable:
      result += '|';
      break;
    }
    result += kind_;
    result += std::to_string(size_);
    return result;
  }

  bool
  Dtype::same_type(Dtype const& other) const
  {
    return kind_ == other.kind_ && size_ == other.size_;
  }

  bool
  Dtype::needs_swap() const
  {
    return order_ != Byte_order::not_applicable && order_ != native_byte_order();
  }

  bool
  operator==(Dtype const& dtype1, Dtype const& dtype2)
  {
    return dtype1.order_ == dtype2.order_ && dtype1.kind_ == dtype2.kind_ &&
           dtype1.size_ == dtype2.size_;
  }

} // end of namespace npzkit::data::detail
