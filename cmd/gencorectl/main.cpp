#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "api/gencore/v1.hpp"

using namespace gencore::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  gencorectl <addr> kinds\n"
            << "  gencorectl <addr> path <from> <to>\n"
            << "  gencorectl <addr> producers <kind>\n"
            << "  gencorectl <addr> consumers <kind>\n"
            << "  gencorectl <addr> dependents <kind>\n"
            << "  gencorectl <addr> validate <from> <to>\n"
            << "  gencorectl <addr> cache-status\n"
            << "  gencorectl <addr> stale\n"
            << "  gencorectl <addr> invalidate <step_key>\n"
            << "  gencorectl <addr> invalidate-source <locator>\n"
            << "  gencorectl <addr> invalidate-kind <generator>\n"
            << "  gencorectl <addr> invalidate-all\n"
            << "  gencorectl <addr> history [limit]\n"
            << "  gencorectl <addr> summary <run_id>\n"
            << "  gencorectl <addr> steps <run_id>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static std::string TransformSuffix(bool has_transform, const std::string& transform) {
  return has_transform ? " (" + transform + ")" : "";
}

static std::string RunStateName(RunState state) {
  switch (state) {
    case RUN_STATE_RUNNING:
      return "running";
    case RUN_STATE_COMPLETED:
      return "completed";
    case RUN_STATE_SUPERSEDED:
      return "superseded";
    default:
      return "unknown";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto graph_stub = KindGraphService::NewStub(channel);
  auto cache_stub = BuildCacheService::NewStub(channel);
  auto plan_stub  = GenerationPlanService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "kinds") {
    GraphRequest  req;
    GraphResponse resp;

    auto status = graph_stub->Graph(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::map<std::string, std::vector<std::string>> by_category;
    for (const auto& kind : resp.kinds()) {
      by_category[kind.category()].push_back(kind.name());
    }

    std::cout << "Kind Taxonomy\n=============\n\n";
    for (const char* category : {"source", "model", "artifact"}) {
      auto it = by_category.find(category);
      if (it == by_category.end()) continue;

      auto names = it->second;
      std::sort(names.begin(), names.end());

      std::string upper(category);
      std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
      std::cout << "  " << upper << " (" << names.size() << "):\n";
      for (const auto& name : names) {
        std::cout << "    " << name << "\n";
      }
      std::cout << "\n";
      by_category.erase(it);
    }
    for (const auto& [category, names] : by_category) {
      std::cout << "  " << category << " (" << names.size() << "):\n";
      for (const auto& name : names) {
        std::cout << "    " << name << "\n";
      }
      std::cout << "\n";
    }

    std::cout << "  Transforms (" << resp.edges_size() << "):\n";
    for (const auto& edge : resp.edges()) {
      std::cout << "    " << edge.from_kind() << " --" << edge.relation() << "--> " << edge.to_kind()
                << TransformSuffix(edge.has_transform(), edge.transform()) << "\n";
    }

    std::cout << "\n" << resp.kinds_size() << " kind(s), " << resp.edges_size() << " transform(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "path") {
    if (argc < 5) return 1;

    RouteRequest req;
    req.set_from_kind(argv[3]);
    req.set_to_kind(argv[4]);

    RouteResponse resp;

    auto status = graph_stub->Route(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() == OUTCOME_UNREACHABLE) {
      std::cout << "No path from " << argv[3] << " to " << argv[4] << ".\n";
      return 0;
    }

    std::cout << "Path from " << argv[3] << " to " << argv[4] << ":\n\n";
    std::cout << "  " << argv[3] << "\n";
    for (const auto& hop : resp.path()) {
      std::cout << "    --" << hop.relation() << "-->" << TransformSuffix(hop.has_transform(), hop.transform()) << "\n";
      std::cout << "  " << hop.kind() << "\n";
    }
    std::cout << "\n" << resp.path_size() << " step(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "producers") {
    if (argc < 4) return 1;

    ProducersRequest req;
    req.set_kind(argv[3]);

    ProducersResponse resp;

    auto status = graph_stub->Producers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.producers_size() == 0) {
      std::cout << "No transforms produce " << argv[3] << ".\n";
      return 0;
    }
    std::cout << "Transforms producing " << argv[3] << ":\n\n";
    for (const auto& ref : resp.producers()) {
      std::cout << "  " << ref.kind() << TransformSuffix(ref.has_transform(), ref.transform()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "consumers") {
    if (argc < 4) return 1;

    ConsumersRequest req;
    req.set_kind(argv[3]);

    ConsumersResponse resp;

    auto status = graph_stub->Consumers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.consumers_size() == 0) {
      std::cout << "No transforms consume " << argv[3] << ".\n";
      return 0;
    }
    std::cout << "Transforms consuming " << argv[3] << ":\n\n";
    for (const auto& ref : resp.consumers()) {
      std::cout << "  " << ref.kind() << TransformSuffix(ref.has_transform(), ref.transform()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dependents") {
    if (argc < 4) return 1;

    DependentsRequest req;
    req.set_kind(argv[3]);

    DependentsResponse resp;

    auto status = graph_stub->Dependents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& kind : resp.downstream()) {
      std::cout << kind << "\n";
    }
    std::cout << resp.downstream_size() << " downstream kind(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 5) return 1;

    ValidateRequest req;
    req.set_from_kind(argv[3]);
    req.set_to_kind(argv[4]);

    ValidateResponse resp;

    auto status = graph_stub->Validate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() != OUTCOME_OK) {
      std::cout << "invalid: " << resp.message() << "\n";
      return 3;
    }
    std::cout << "ok\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-status") {
    CacheStatusRequest  req;
    CacheStatusResponse resp;

    auto status = cache_stub->Status(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.step_key() << " input=" << entry.input_hash() << " last_run=" << entry.last_run().seconds()
                << (entry.stale() ? " stale" : "") << "\n";
    }
    std::cout << resp.entries_size() << " entry(ies)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stale") {
    StaleStepsRequest  req;
    StaleStepsResponse resp;

    auto status = cache_stub->StaleSteps(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.steps()) {
      std::cout << step << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate") {
    if (argc < 4) return 1;

    InvalidateRequest req;
    req.set_step_key(argv[3]);

    InvalidateResponse resp;

    auto status = cache_stub->Invalidate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() == OUTCOME_NOT_FOUND) {
      std::cout << "not found: " << argv[3] << "\n";
      return 3;
    }
    std::cout << "invalidated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate-source") {
    if (argc < 4) return 1;

    InvalidateBySourceRequest req;
    req.set_source_locator(argv[3]);

    InvalidateBySourceResponse resp;

    auto status = cache_stub->InvalidateBySource(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.invalidated()) {
      std::cout << step << "\n";
    }
    std::cout << "invalidated=" << resp.invalidated_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate-kind") {
    if (argc < 4) return 1;

    InvalidateByKindRequest req;
    req.set_kind_name(argv[3]);

    InvalidateByKindResponse resp;

    auto status = cache_stub->InvalidateByKind(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.invalidated()) {
      std::cout << step << "\n";
    }
    std::cout << "invalidated=" << resp.invalidated_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalidate-all") {
    InvalidateAllRequest  req;
    InvalidateAllResponse resp;

    auto status = cache_stub->InvalidateAll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared=" << resp.cleared() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    HistoryRequest req;
    req.set_limit(argc >= 4 ? static_cast<uint32_t>(std::stoul(argv[3])) : 0);

    HistoryResponse resp;

    auto status = plan_stub->History(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.runs()) {
      std::cout << entry.run().run_id() << " " << RunStateName(entry.run().status()) << " total=" << entry.total()
                << " executed=" << entry.executed() << " cached=" << entry.cached() << " failed=" << entry.failed() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    if (argc < 4) return 1;

    RunSummaryRequest req;
    req.set_run_id(argv[3]);

    RunSummaryResponse resp;

    auto status = plan_stub->RunSummary(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& summary = resp.summary();
    std::cout << "total=" << summary.total() << "\n";
    std::cout << "executed=" << summary.executed() << "\n";
    std::cout << "cached=" << summary.cached() << "\n";
    std::cout << "failed=" << summary.failed() << "\n";
    std::cout << "duration_ms=" << summary.total_duration_ms() << "\n";
    std::cout << "files=" << summary.files_produced() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "steps") {
    if (argc < 4) return 1;

    RunStatusRequest req;
    req.set_run_id(argv[3]);

    RunStatusResponse resp;

    auto status = plan_stub->RunStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.steps()) {
      std::cout << step.step_key() << " " << step.status() << " duration_ms=" << step.duration_ms()
                << " files=" << step.files_produced() << (step.cached() ? " cached" : "") << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
