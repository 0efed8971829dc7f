#pragma once

#include <cstdint>
#include <string>

namespace gencore::db::model {

/*
  Outcome of one generation step inside a run.

  Keyed by (run_id, step_key). Re-recording replaces the row in place, so
  listing order is first-recorded order.
*/

struct StepRecord {
  std::string run_id;
  std::string step_key;

  std::string status; // "done", "cached", "failed", or driver specific

  uint64_t files_produced = 0;
  uint64_t duration_ms    = 0;
  bool     cached         = false;

  uint64_t recorded_at_ms = 0;
};

} // namespace gencore::db::model
