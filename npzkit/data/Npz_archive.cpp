#include <npzkit/data/Npz_archive.hpp>

//
// ... Standard header files
//
#include <cassert>
#include <stdexcept>

//
// ... npzkit header files
//
#include <npzkit/data/Npz_archive_Impl.hpp>

namespace npzkit::data::detail {

  namespace {

    constexpr std::string_view suffix{".npy"};

    std::string
    member_name_of(std::string_view name)
    {
      return std::string(name) + std::string(suffix);
    }

  } // end of anonymous namespace

  Npz_archive::Npz_archive()
      : pimpl(new Impl())
  {}

  Npz_archive::Npz_archive(Npz_archive const& input)
      : pimpl(new Impl(*input.pimpl))
  {}

  Npz_archive::Npz_archive(Npz_archive&& input)
      : pimpl(input.pimpl)
  {
    input.pimpl = nullptr;
  }

  Npz_archive::~Npz_archive()
  {
    delete pimpl;
  }

  Npz_archive&
  Npz_archive::operator=(Npz_archive const& input)
  {
    if (this != &input) {
      delete pimpl;
      pimpl = new Impl(*input.pimpl);
    }
    return *this;
  }

  Npz_archive&
  Npz_archive::operator=(Npz_archive&& input)
  {
    if (this != &input) {
      delete pimpl;
      pimpl = input.pimpl;
      input.pimpl = nullptr;
    }
    return *this;
  }

  std::optional<Npy_array>
  Npz_archive::by_name(std::string_view name) const
  {
    assert(pimpl);
    auto bytes = pimpl->find(member_name_of(name));
    if (bytes == nullptr) {
      return std::nullopt;
    }
    return Npy_array::parse(*bytes);
  }

  bool
  Npz_archive::contains(std::string_view name) const
  {
    assert(pimpl);
    return pimpl->find(member_name_of(name)) != nullptr;
  }

  std::vector<std::string>
  Npz_archive::names() const
  {
    assert(pimpl);
    std::vector<std::string> result;
    for (auto& member_name : pimpl->member_names()) {
      if (member_name.ends_with(suffix)) {
        member_name.resize(member_name.size() - suffix.size());
        result.push_back(std::move(member_name));
      }
    }
    return result;
  }

  Npy_builder
  Npz_archive::start_array(std::string name, Dtype dtype, std::vector<std::uint64_t> shape)
  {
    assert(pimpl);
    if (contains(name)) {
      throw std::invalid_argument("npz: duplicate array '" + name + "'");
    }
    return Npy_builder{*this, std::move(name), Npy_header{dtype, Order::c, std::move(shape)}};
  }

  void
  Npz_archive::insert_member(std::string member_name, std::string bytes)
  {
    assert(pimpl);
    pimpl->insert(std::move(member_name), std::move(bytes));
  }

  std::vector<std::string>
  Npz_archive::member_names() const
  {
    assert(pimpl);
    return pimpl->member_names();
  }

  std::string const&
  Npz_archive::member(std::string_view member_name) const
  {
    assert(pimpl);
    auto bytes = pimpl->find(member_name);
    if (bytes == nullptr) {
      throw std::invalid_argument("npz: no member '" + std::string(member_name) + "'");
    }
    return *bytes;
  }

} // end of namespace npzkit::data::detail
