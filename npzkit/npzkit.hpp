#pragma once

//
// ... npzkit header files
//
#include <npzkit/config.hpp>
#include <npzkit/data.hpp>

namespace npzkit {
  using namespace ::npzkit::data;

} // end of namespace npzkit
