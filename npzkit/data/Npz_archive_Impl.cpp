#include <npzkit/data/Npz_archive_Impl.hpp>

//
// ... Standard header files
//
#include <algorithm>

//
// ... npzkit header files
//
#include <npzkit/data/errors.hpp>

namespace npzkit::data::detail {

  std::string const*
  Npz_archive::Impl::find(std::string_view member_name) const
  {
    auto it = std::find_if(members_.begin(), members_.end(),
      [&](auto const& member) { return member.first == member_name; });
    return it == members_.end() ? nullptr : &it->second;
  }

  void
  Npz_archive::Impl::insert(std::string member_name, std::string bytes)
  {
    if (find(member_name) != nullptr) {
      throw std::invalid_argument("npz: duplicate member '" + member_name + "'");
    }
    members_.emplace_back(std::move(member_name), std::move(bytes));
  }

  std::vector<std::string>
  Npz_archive::Impl::member_names() const
  {
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (auto const& [name, bytes] : members_) {
      result.push_back(name);
    }
    return result;
  }

} // end of namespace npzkit::data::detail
