#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"

namespace gencore::plan {

using gencore::core::Outcome;

// Step statuses the summaries count. Other values are stored as given.
inline constexpr std::string_view kStepDone   = "done";
inline constexpr std::string_view kStepCached = "cached";
inline constexpr std::string_view kStepFailed = "failed";

std::string_view ToString(db::model::RunStatus status);

struct BeginResult {
  Outcome                    outcome = Outcome::Ok;
  db::model::RunRecord       run;
  std::optional<std::string> superseded; // run auto-completed by this begin
};

struct StepRequest {
  std::string step_key;
  std::string status;
  uint64_t    files_produced = 0;
  uint64_t    duration_ms    = 0;
  bool        cached         = false;
};

struct RecordStepResult {
  Outcome                    outcome = Outcome::Ok;
  std::optional<std::string> run; // absent when no run was active
};

struct CompleteResult {
  Outcome                             outcome = Outcome::Ok;
  std::optional<db::model::RunRecord> run;
};

struct StepStatus {
  std::string step_key;
  std::string status;
  uint64_t    duration_ms    = 0;
  bool        cached         = false;
  uint64_t    files_produced = 0;
};

struct RunSummary {
  uint64_t total          = 0;
  uint64_t executed       = 0;
  uint64_t cached         = 0;
  uint64_t failed         = 0;
  uint64_t total_duration = 0;
  uint64_t files_produced = 0;
};

struct HistoryEntry {
  db::model::RunRecord run;
  uint64_t             total    = 0;
  uint64_t             executed = 0;
  uint64_t             cached   = 0;
  uint64_t             failed   = 0;
};

/*
  GenerationPlan

  Owns the single active-run slot. begin/complete are the only writers of
  the slot; recordStep reads it and is silently dropped when it is empty.
*/
class GenerationPlan {
 public:
  static constexpr std::size_t kDefaultHistoryLimit = 10;

  explicit GenerationPlan(std::shared_ptr<db::Repository> repository);

  BeginResult      Begin();
  RecordStepResult RecordStep(const StepRequest& step);
  CompleteResult   Complete();

  // Unknown runs report no steps.
  std::vector<StepStatus> Status(const std::string& run_id);
  RunSummary              Summary(const std::string& run_id);

  // Most recently started first. 0 selects kDefaultHistoryLimit.
  std::vector<HistoryEntry> History(std::size_t limit);

  std::optional<std::string> ActiveRun();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gencore::plan
