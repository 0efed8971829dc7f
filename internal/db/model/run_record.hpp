#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gencore::db::model {

enum class RunStatus {
  Running = 0,
  Completed,
  Superseded, // auto-completed because a new run began while it was active
};

/*
  One generation run.

  sequence is strictly increasing in begin order and is what "most recently
  started" means for history queries.
*/

struct RunRecord {
  std::string run_id;
  uint64_t    sequence = 0;

  uint64_t                started_at_ms = 0;
  std::optional<uint64_t> completed_at_ms;

  RunStatus status = RunStatus::Running;
};

} // namespace gencore::db::model
