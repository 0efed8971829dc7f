#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"

namespace gencore::graph {

using gencore::core::Outcome;

struct DefineResult {
  Outcome     outcome = Outcome::Ok; // Ok | Exists | Invalid
  std::string kind;
  std::string message;
};

struct ConnectResult {
  Outcome     outcome = Outcome::Ok; // Ok | Invalid
  std::string message;
};

struct Hop {
  std::string                kind;
  std::string                relation;
  std::optional<std::string> transform;
};

struct RouteResult {
  Outcome          outcome = Outcome::Ok; // Ok | Unreachable
  std::vector<Hop> path;                  // excludes the starting kind
  std::string      message;
};

struct ValidateResult {
  Outcome     outcome = Outcome::Ok; // Ok | Invalid
  std::string message;
};

struct DependentsResult {
  Outcome                  outcome = Outcome::Ok;
  std::vector<std::string> downstream;
};

struct TransformRef {
  std::string                kind; // from_kind for producers, to_kind for consumers
  std::optional<std::string> transform;
};

struct GraphDump {
  std::vector<db::model::KindRecord> kinds;
  std::vector<db::model::EdgeRecord> edges;
};

/*
  KindGraph

  Registry of kinds and the transforms between them.

  Invariant: kinds and edges always form a DAG and every edge references
  defined kinds. connect() enforces this before the edge is committed; it
  is never repaired after the fact.

  Traversals expand neighbours in edge insertion order and keep the first
  discovery of a kind, so route() picks the same shortest path every time
  for a fixed graph.
*/
class KindGraph {
 public:
  explicit KindGraph(std::shared_ptr<db::Repository> repository);

  DefineResult Define(const std::string& name, const std::string& category);

  ConnectResult Connect(const std::string& from, const std::string& to, const std::string& relation,
                        const std::optional<std::string>& transform = std::nullopt);

  RouteResult Route(const std::string& from, const std::string& to);

  // Direct adjacency only, not reachability.
  ValidateResult Validate(const std::string& from, const std::string& to);

  DependentsResult Dependents(const std::string& kind);

  std::vector<TransformRef> Producers(const std::string& kind);
  std::vector<TransformRef> Consumers(const std::string& kind);

  GraphDump Graph();

  std::optional<db::model::KindRecord> Kind(const std::string& name);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gencore::graph
