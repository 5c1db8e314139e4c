#pragma once

#include <string>

namespace sgw::common {

/// The single entity type served by the gateway.
/// sId is the full record id ("person:tobie"); empty before creation.
/// Class abbreviation: pn
struct Person {
  std::string sId;
  std::string sName;
};

}  // namespace sgw::common
