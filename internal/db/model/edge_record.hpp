#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gencore::db::model {

/*
  Directed kind edge.

    from ---relation/transform---> to

  Identity is (from_kind, to_kind, relation). Backends keep insertion
  order when listing; graph traversal depends on it for stable routes.
*/

struct EdgeRecord {
  std::string from_kind;
  std::string to_kind;

  std::string relation; // "parses_to", "normalizes_to", "renders_to", ...

  // generator performing the conversion, if any
  std::optional<std::string> transform;

  uint64_t created_at_ms = 0;
};

} // namespace gencore::db::model
