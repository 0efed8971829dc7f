#pragma once

#include <cstdint>
#include <string>

namespace gencore::db::model {

/*
  A registered kind. Immutable once inserted.
*/

struct KindRecord {
  std::string name;
  std::string category; // "source", "model", "artifact", ...

  uint64_t created_at_ms = 0;
};

} // namespace gencore::db::model
