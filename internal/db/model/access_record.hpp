#pragma once

#include <cstdint>
#include <string>

namespace archive::db::model {

/*
  Access matrix entry keyed by (record_id, principal).
*/
struct AccessRecord {
  uint64_t    record_id = 0;
  std::string principal;
  bool        can_access = false;
};

} // namespace archive::db::model
