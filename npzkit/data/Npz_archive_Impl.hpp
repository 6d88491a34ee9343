#pragma once

//
// ... Standard header files
//
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//
// ... npzkit header files
//
#include <npzkit/data/Npz_archive.hpp>

namespace npzkit::data::detail {

  class Npz_archive::Impl {
  public:
    std::string const*
    find(std::string_view member_name) const;

    void
    insert(std::string member_name, std::string bytes);

    std::vector<std::string>
    member_names() const;

  private:
    std::vector<std::pair<std::string, std::string>> members_;

  }; // end of class Npz_archive::Impl

} // end of namespace npzkit::data::detail
