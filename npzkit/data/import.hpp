#pragma once

//
// ... Standard header files
//
#include <stdexcept>

//
// ... External header files
//
#include <nlohmann/json.hpp>

namespace npzkit::data::detail {

  using nlohmann::json;

  using std::runtime_error;

} // end of namespace npzkit::data::detail
