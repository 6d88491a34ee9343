//
// ... Standard header files
//
#include <cctype>
#include <limits>
#include <optional>
#include <string>

//
// ... npzkit header files
//
#include <npzkit/data/Npy_header.hpp>
#include <npzkit/data/errors.hpp>

namespace npzkit::data::detail {

  namespace {

    constexpr std::string_view magic{"\x93NUMPY", 6};
    constexpr std::size_t alignment = 64;

    std::uint32_t
    read_le(std::string_view bytes, std::size_t offset, std::size_t width)
    {
      std::uint32_t value = 0;
      for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + i]))
                 << (8 * i);
      }
      return value;
    }

    std::string
    format_shape(std::vector<std::uint64_t> const& shape)
    {
      std::string result = "(";
      for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) { result += ", "; }
        result += std::to_string(shape[i]);
      }
      if (shape.size() == 1) { result += ","; }
      result += ")";
      return result;
    }

    // Parser for the Python literal dictionary of a header, e.g.
    //   {'descr': '<i4', 'fortran_order': False, 'shape': (3,), }
    class Dict_parser {
    public:
      explicit Dict_parser(std::string_view text)
          : text_(text)
      {}

      Npy_header
      parse()
      {
        std::optional<Dtype> dtype;
        std::optional<Order> order;
        std::optional<std::vector<std::uint64_t>> shape;

        expect('{');
        while (!consume('}')) {
          auto key = parse_string();
          expect(':');
          if (key == "descr") {
            skip_space();
            if (peek() != '\'' && peek() != '"') {
              throw Npy_format_error("structured dtypes are not supported");
            }
            dtype = Dtype::parse(parse_string());
          } else if (key == "fortran_order") {
            order = parse_bool() ? Order::fortran : Order::c;
          } else if (key == "shape") {
            shape = parse_tuple();
          } else {
            throw Npy_format_error("unexpected header key: '" + key + "'");
          }
          if (!consume(',')) {
            expect('}');
            break;
          }
        }

        if (!dtype || !order || !shape) {
          throw Npy_format_error("header is missing one of 'descr', 'fortran_order', 'shape'");
        }
        return Npy_header{*dtype, *order, std::move(*shape)};
      }

    private:
      char
      peek() const
      {
        return pos_ < text_.size() ? text_[pos_] : '\0';
      }

      void
      skip_space()
      {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
          ++pos_;
        }
      }

      bool
      consume(char c)
      {
        skip_space();
        if (peek() == c) {
          ++pos_;
          return true;
        }
        return false;
      }

      void
      expect(char c)
      {
        if (!consume(c)) {
          throw Npy_format_error(
            "malformed header: expected '" + std::string(1, c) + "' at offset " +
            std::to_string(pos_));
        }
      }

      std::string
      parse_string()
      {
        skip_space();
        char quote = peek();
        if (quote != '\'' && quote != '"') {
          throw Npy_format_error("malformed header: expected a string at offset " +
                                 std::to_string(pos_));
        }
        ++pos_;
        std::string result;
        while (pos_ < text_.size() && text_[pos_] != quote) {
          if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) { ++pos_; }
          result += text_[pos_++];
        }
        if (pos_ == text_.size()) {
          throw Npy_format_error("malformed header: unterminated string");
        }
        ++pos_;
        return result;
      }

      bool
      parse_bool()
      {
        skip_space();
        auto rest = text_.substr(pos_);
        if (rest.starts_with("True")) {
          pos_ += 4;
          return true;
        }
        if (rest.starts_with("False")) {
          pos_ += 5;
          return false;
        }
        throw Npy_format_error("malformed header: expected True or False");
      }

      std::uint64_t
      parse_integer()
      {
        skip_space();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
          throw Npy_format_error("malformed header: expected a dimension at offset " +
                                 std::to_string(pos_));
        }
        std::uint64_t value = 0;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
          auto digit = static_cast<std::uint64_t>(peek() - '0');
          if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw Npy_format_error("malformed header: dimension overflows");
          }
          value = value * 10 + digit;
          ++pos_;
        }
        // Python 2 long literal
        if (peek() == 'L') { ++pos_; }
        return value;
      }

      std::vector<std::uint64_t>
      parse_tuple()
      {
        std::vector<std::uint64_t> result;
        expect('(');
        while (!consume(')')) {
          result.push_back(parse_integer());
          if (!consume(',')) {
            expect(')');
            break;
          }
        }
        return result;
      }

      std::string_view text_;
      std::size_t pos_{};

    }; // end of class Dict_parser

  } // end of anonymous namespace

  std::uint64_t
  element_count(std::vector<std::uint64_t> const& shape)
  {
    std::uint64_t count = 1;
    for (auto dim : shape) {
      if (dim != 0 && count > std::numeric_limits<std::uint64_t>::max() / dim) {
        throw Npy_format_error("element count overflows");
      }
      count *= dim;
    }
    return count;
  }

  std::string
  format_npy_header(Npy_header const& header)
  {
    std::string dict = "{'descr': '" + header.dtype.descr() + "', 'fortran_order': " +
                       (header.order == Order::fortran ? "True" : "False") +
                       ", 'shape': " + format_shape(header.shape) + ", }";

    auto prefix = magic.size() + 2 + 2;
    if (dict.size() + 1 + prefix > std::numeric_limits<std::uint16_t>::max()) {
      prefix = magic.size() + 2 + 4;
    }

    auto padding = alignment - (prefix + dict.size() + 1) % alignment;
    if (padding == alignment) { padding = 0; }
    dict.append(padding, ' ');
    dict.push_back('\n');

    std::string result{magic};
    auto const length = dict.size();
    if (prefix == magic.size() + 4) {
      result += '\x01';
      result += '\x00';
      result += static_cast<char>(length & 0xFF);
      result += static_cast<char>((length >> 8) & 0xFF);
    } else {
      result += '\x02';
      result += '\x00';
      for (int shift = 0; shift < 32; shift += 8) {
        result += static_cast<char>((length >> shift) & 0xFF);
      }
    }
    result += dict;
    return result;
  }

  Parsed_npy_header
  parse_npy_header(std::string_view bytes)
  {
    if (bytes.size() < magic.size() + 4 || bytes.substr(0, magic.size()) != magic) {
      throw Npy_format_error("missing magic string");
    }

    auto major = static_cast<unsigned char>(bytes[magic.size()]);
    auto minor = static_cast<unsigned char>(bytes[magic.size() + 1]);
    if (major < 1 || major > 3 || minor != 0) {
      throw Npy_format_error(
        "unsupported format version " + std::to_string(major) + "." + std::to_string(minor));
    }

    std::size_t const width = major == 1 ? 2 : 4;
    auto const start = magic.size() + 2 + width;
    if (bytes.size() < start) {
      throw Npy_format_error("truncated header");
    }

    std::size_t const length = read_le(bytes, magic.size() + 2, width);
    if (bytes.size() - start < length) {
      throw Npy_format_error("truncated header");
    }

    Dict_parser parser{bytes.substr(start, length)};
    return Parsed_npy_header{parser.parse(), start + length};
  }

} // end of namespace npzkit::data::detail
