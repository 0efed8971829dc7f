#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gencore::db::model {

/*
  Build cache row, one per step key.

  Hashes are opaque caller-supplied strings. The stale flag is independent
  of the hashes: an invalidated entry stays stale until re-recorded.
*/

struct CacheEntryRecord {
  std::string step_key;

  std::string input_hash;
  std::string output_hash;

  std::optional<std::string> output_ref;     // where the output lives
  std::optional<std::string> source_locator; // provenance, e.g. spec path

  bool deterministic = true;
  bool stale         = false;

  uint64_t last_run_ms = 0;
};

} // namespace gencore::db::model
