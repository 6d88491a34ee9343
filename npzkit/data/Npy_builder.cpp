#include <npzkit/data/Npy_builder.hpp>

//
// ... Standard header files
//
#include <stdexcept>

//
// ... npzkit header files
//
#include <npzkit/data/Npz_archive.hpp>

namespace npzkit::data::detail {

  Npy_builder::Npy_builder(Npz_archive& archive, std::string name, Npy_header const& header)
      : archive_(&archive)
      , name_(std::move(name))
      , dtype_(header.dtype)
      , expected_(element_count(header.shape))
      , bytes_(format_npy_header(header))
  {
    if (dtype_.byte_order() == Byte_order::big) {
      throw std::invalid_argument("npy builder: arrays are written little-endian");
    }
  }

  Npy_builder&
  Npy_builder::push_bytes(std::string_view value)
  {
    if (dtype_.kind() != 'S') {
      throw std::invalid_argument(
        "npy builder: cannot push a byte string into '" + name_ + "' of dtype " + dtype_.descr());
    }
    if (value.size() > dtype_.size()) {
      throw std::invalid_argument(
        "npy builder: byte string longer than " + dtype_.descr() + " in '" + name_ + "'");
    }
    if (count_ == expected_) {
      throw std::invalid_argument("npy builder: too many elements for '" + name_ + "'");
    }
    bytes_.append(value);
    bytes_.append(dtype_.size() - value.size(), '\0');
    ++count_;
    return *this;
  }

  void
  Npy_builder::finish()
  {
    if (count_ != expected_) {
      throw std::invalid_argument(
        "npy builder: '" + name_ + "' received " + std::to_string(count_) + " of " +
        std::to_string(expected_) + " elements");
    }
    archive_->insert_member(name_ + ".npy", std::move(bytes_));
    bytes_.clear();
  }

  void
  Npy_builder::check_element(Dtype const& dtype) const
  {
    if (!dtype_.same_type(dtype)) {
      throw std::invalid_argument(
        "npy builder: cannot push " + dtype.descr() + " into '" + name_ + "' of dtype " +
        dtype_.descr());
    }
    if (count_ == expected_) {
      throw std::invalid_argument("npy builder: too many elements for '" + name_ + "'");
    }
  }

} // end of namespace npzkit::data::detail
