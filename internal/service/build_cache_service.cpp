#include "build_cache_service.hpp"

#include <string>

#include "internal/cache/build_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace gencore::service {

using namespace gencore::v1;

namespace {

void Require(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
}

} // namespace

BuildCacheService::BuildCacheService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CheckResponse BuildCacheService::Check(const CheckRequest& req) {
  return ObserveRpc("BuildCache.Check", [&] {
    Require(req.step_key(), "step_key");

    const bool deterministic = req.has_deterministic() ? req.deterministic() : true;
    auto       result        = ctx_.build_cache->Check(req.step_key(), req.input_hash(), deterministic);

    CheckResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    if (result.previous_hash) {
      resp.set_previous_hash(*result.previous_hash);
    }
    if (result.outcome == gencore::core::Outcome::Unchanged) {
      *resp.mutable_last_run() = util::MillisToProto(result.last_run_ms);
      if (result.output_ref) {
        resp.set_output_ref(*result.output_ref);
      }
    }
    return resp;
  });
}

RecordResponse BuildCacheService::Record(const RecordRequest& req) {
  return ObserveRpc("BuildCache.Record", [&] {
    gencore::cache::RecordRequest record;
    record.step_key    = req.step_key();
    record.input_hash  = req.input_hash();
    record.output_hash = req.output_hash();
    if (req.has_output_ref()) {
      record.output_ref = req.output_ref();
    }
    if (req.has_source_locator()) {
      record.source_locator = req.source_locator();
    }
    record.deterministic = req.has_deterministic() ? req.deterministic() : true;

    auto result = ctx_.build_cache->Record(record);

    RecordResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_step_key(result.step_key);
    resp.set_message(result.message);
    return resp;
  });
}

InvalidateResponse BuildCacheService::Invalidate(const InvalidateRequest& req) {
  return ObserveRpc("BuildCache.Invalidate", [&] {
    Require(req.step_key(), "step_key");

    auto result = ctx_.build_cache->Invalidate(req.step_key());

    InvalidateResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_step_key(result.step_key);
    return resp;
  });
}

InvalidateBySourceResponse BuildCacheService::InvalidateBySource(const InvalidateBySourceRequest& req) {
  return ObserveRpc("BuildCache.InvalidateBySource", [&] {
    Require(req.source_locator(), "source_locator");

    auto result = ctx_.build_cache->InvalidateBySource(req.source_locator());

    InvalidateBySourceResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    for (const auto& step_key : result.invalidated) {
      resp.add_invalidated(step_key);
    }
    return resp;
  });
}

InvalidateByKindResponse BuildCacheService::InvalidateByKind(const InvalidateByKindRequest& req) {
  return ObserveRpc("BuildCache.InvalidateByKind", [&] {
    Require(req.kind_name(), "kind_name");

    auto result = ctx_.build_cache->InvalidateByKind(req.kind_name());

    InvalidateByKindResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    for (const auto& step_key : result.invalidated) {
      resp.add_invalidated(step_key);
    }
    return resp;
  });
}

InvalidateAllResponse BuildCacheService::InvalidateAll(const InvalidateAllRequest&) {
  return ObserveRpc("BuildCache.InvalidateAll", [&] {
    auto result = ctx_.build_cache->InvalidateAll();

    InvalidateAllResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_cleared(result.cleared);
    return resp;
  });
}

CacheStatusResponse BuildCacheService::Status(const CacheStatusRequest&) {
  return ObserveRpc("BuildCache.Status", [&] {
    CacheStatusResponse resp;
    resp.set_outcome(OUTCOME_OK);
    for (const auto& entry : ctx_.build_cache->Status()) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

StaleStepsResponse BuildCacheService::StaleSteps(const StaleStepsRequest&) {
  return ObserveRpc("BuildCache.StaleSteps", [&] {
    StaleStepsResponse resp;
    resp.set_outcome(OUTCOME_OK);
    for (const auto& step_key : ctx_.build_cache->StaleSteps()) {
      resp.add_steps(step_key);
    }
    return resp;
  });
}

} // namespace gencore::service
